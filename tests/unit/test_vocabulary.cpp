#include "tinyformer/vocabulary.h"
#include "tinyformer/errors.h"
#include "data/toy_corpora.h"
#include "data/dataloader.h"
#include "../test_utils.h"
#include <algorithm>
#include <iostream>
#include <set>

using namespace tinyformer;

void test_mapping() {
    test::section("Test 1: Token <-> Id");

    Vocabulary vocab({"what", "is", "statquest", "awesome", "<EOS>"});
    test::expect_true(vocab.size() == 5, "size counts every token");
    test::expect_true(vocab.id("statquest") == 2 && vocab.token(4) == "<EOS>", "id is the list position");
    test::expect_true(vocab.contains("awesome") && !vocab.contains("boring"), "contains");

    auto ids = vocab.encode({"what", "is", "awesome"});
    test::expect_true(ids == std::vector<int>({0, 1, 3}), "encode maps each token");
    test::expect_true(vocab.decode(ids) == "what is awesome", "decode joins tokens with spaces");
    test::expect_true(vocab.decode({}).empty(), "decoding nothing gives an empty string");
}

void test_errors() {
    test::section("Test 2: Errors");

    Vocabulary vocab({"a", "b"});
    test::expect_throws<VocabularyError>([&]() { vocab.id("c"); }, "unknown token throws VocabularyError");
    test::expect_throws<VocabularyError>([&]() { vocab.token(2); }, "id past the end throws VocabularyError");
    test::expect_throws<VocabularyError>([&]() { vocab.token(-1); }, "negative id throws VocabularyError");
    test::expect_throws<VocabularyError>([&]() { vocab.decode({0, 7}); }, "decode with a bad id throws");
    test::expect_throws<InvalidConfigError>([]() { Vocabulary bad({"a", "a"}); }, "duplicate token rejected");
    test::expect_throws<InvalidConfigError>([]() { Vocabulary bad({"a", ""}); }, "empty token rejected");
    test::expect_throws<InvalidConfigError>([]() { Vocabulary bad(std::vector<std::string>{}); }, "empty vocabulary rejected");
}

void test_toy_corpora() {
    test::section("Test 3: Toy Corpora");

    ClassifierCorpus classifier = make_classifier_corpus();
    test::expect_true(classifier.vocab.size() == 12 && classifier.pad_id == 11, "12-token classifier vocabulary, <PAD> = 11");
    test::expect_true(classifier.dataset.size() == 7, "seven labelled sentences");

    bool padded = true;
    int positives = 0;
    for (size_t i = 0; i < classifier.dataset.size(); i++) {
        const Example& e = classifier.dataset.get_item(i);
        padded = padded && e.input.size() == classifier.seq_len && e.labels.size() == 1;
        positives += e.labels[0];
    }
    test::expect_true(padded, "every sentence padded to 6 with one label");
    test::expect_true(positives == 4, "four positive, three negative");
    test::expect_true(classifier.dataset.get_item(0).input == std::vector<int>({0, 1, 2, 11, 11, 11}),
                      "Edison is handsome <PAD> <PAD> <PAD>");

    TranslationCorpus translation = make_translation_corpus();
    const Example& lets_go = translation.dataset.get_item(0);
    test::expect_true(translation.source_vocab.decode(lets_go.input) == "let's go", "source sentence");
    test::expect_true(translation.target_vocab.decode(lets_go.decoder_input) == "<SOS> vamos", "decoder input starts with <SOS>");
    test::expect_true(translation.target_vocab.decode(lets_go.labels) == "vamos <EOS>", "labels end with <EOS>");

    PromptCorpus prompts = make_prompt_corpus();
    bool shifted = true;
    for (size_t i = 0; i < prompts.dataset.size(); i++) {
        const Example& e = prompts.dataset.get_item(i);
        for (size_t t = 0; t + 1 < e.input.size(); t++) {
            shifted = shifted && e.labels[t] == e.input[t + 1];
        }
        shifted = shifted && e.labels.back() == prompts.eos_id;
    }
    test::expect_true(shifted, "decoder-only labels are the inputs shifted by one, ending in <EOS>");

    test::expect_throws<ShapeError>([]() { pad_to({1, 2, 3}, 2, 0); }, "pad_to rejects over-long sequences");
}

void test_dataloader() {
    test::section("Test 4: DataLoader");

    ClassifierCorpus corpus = make_classifier_corpus();
    DataLoader loader(corpus.dataset, true, 7);

    std::set<const Example*> seen;
    while (loader.has_next()) seen.insert(&loader.next());
    test::expect_true(seen.size() == corpus.dataset.size(), "one epoch visits every example once");
    test::expect_throws<std::runtime_error>([&]() { loader.next(); }, "reading past the epoch throws");

    loader.reset();
    test::expect_true(loader.has_next(), "reset starts a new epoch");

    DataLoader ordered(corpus.dataset, false);
    test::expect_true(&ordered.next() == &corpus.dataset.get_item(0), "unshuffled loader keeps dataset order");

    ExampleDataset empty;
    test::expect_throws<std::invalid_argument>([&]() { DataLoader bad(empty); }, "empty dataset rejected");
    test::expect_throws<std::invalid_argument>([&]() { empty.add(Example{}); }, "example without input rejected");
}

int main() {
    std::cout << "=== Vocabulary & Data Test Suite ===" << std::endl;

    try {
        test_mapping();
        test_errors();
        test_toy_corpora();
        test_dataloader();
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return test::finish("Vocabulary");
}
