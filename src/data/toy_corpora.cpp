#include "data/toy_corpora.h"
#include "tinyformer/errors.h"
#include <string>
#include <utility>

namespace tinyformer {

std::vector<int> pad_to(std::vector<int> ids, size_t length, int pad_id) {
    if (ids.size() > length) {
        throw ShapeError("Sequence of length " + std::to_string(ids.size()) +
                         " does not fit in " + std::to_string(length));
    }
    ids.resize(length, pad_id);
    return ids;
}

ClassifierCorpus make_classifier_corpus() {
    Vocabulary vocab({"Edison", "is", "handsome", "StatQuest", "awesome", "Josh",
                      "not", "boring", "the", "ugly", "great", "<PAD>"});
    const int pad_id = vocab.id("<PAD>");
    const size_t seq_len = 6;

    const std::vector<std::pair<std::vector<std::string>, int>> sentences = {
        {{"Edison", "is", "handsome"}, 1},
        {{"StatQuest", "is", "awesome"}, 1},
        {{"Josh", "is", "great"}, 1},
        {{"Edison", "is", "not", "handsome"}, 0},
        {{"StatQuest", "is", "boring"}, 0},
        {{"Josh", "is", "ugly"}, 0},
        {{"StatQuest", "is", "not", "boring"}, 1},
    };

    ExampleDataset dataset;
    for (const auto& s : sentences) {
        Example example;
        example.input = pad_to(vocab.encode(s.first), seq_len, pad_id);
        example.labels = {s.second};
        dataset.add(std::move(example));
    }

    return ClassifierCorpus{std::move(vocab), std::move(dataset), 2, pad_id, seq_len};
}

TranslationCorpus make_translation_corpus() {
    Vocabulary english({"let's", "to", "go", "<EOS>"});
    Vocabulary spanish({"ir", "vamos", "y", "<EOS>", "<SOS>", "<PAD>"});
    const int sos = spanish.id("<SOS>");
    const int eos = spanish.id("<EOS>");

    ExampleDataset dataset;

    Example lets_go;
    lets_go.input = english.encode({"let's", "go"});
    lets_go.decoder_input = {sos, spanish.id("vamos")};
    lets_go.labels = {spanish.id("vamos"), eos};
    dataset.add(std::move(lets_go));

    Example to_go;
    to_go.input = english.encode({"to", "go"});
    to_go.decoder_input = {sos, spanish.id("ir")};
    to_go.labels = {spanish.id("ir"), eos};
    dataset.add(std::move(to_go));

    return TranslationCorpus{std::move(english), std::move(spanish), std::move(dataset), sos, eos};
}

PromptCorpus make_prompt_corpus() {
    Vocabulary vocab({"what", "is", "statquest", "awesome", "<EOS>"});

    ExampleDataset dataset;

    // Labels are the inputs shifted left by one, closed with <EOS>.
    Example first;
    first.input = vocab.encode({"what", "is", "statquest", "<EOS>", "awesome"});
    first.labels = vocab.encode({"is", "statquest", "<EOS>", "awesome", "<EOS>"});
    dataset.add(std::move(first));

    Example second;
    second.input = vocab.encode({"statquest", "is", "what", "<EOS>", "awesome"});
    second.labels = vocab.encode({"is", "what", "<EOS>", "awesome", "<EOS>"});
    dataset.add(std::move(second));

    const int eos = vocab.id("<EOS>");
    return PromptCorpus{std::move(vocab), std::move(dataset), eos};
}

} // namespace tinyformer
