#include "tinyformer/encoder_classifier.h"
#include "tinyformer/seq2seq_model.h"
#include "tinyformer/decoder_only_model.h"
#include "tinyformer/errors.h"
#include "data/toy_corpora.h"
#include "training/trainer.h"
#include "utils/metrics.h"
#include "../test_utils.h"
#include <iostream>
#include <vector>
#include <string>

using namespace tinyformer;

namespace {

const int D_MODEL = 16;

training::TrainingConfig scenario_training(int num_epochs) {
    training::TrainingConfig config;
    config.learning_rate = 0.02f;
    config.num_epochs = num_epochs;
    config.log_interval = 100;
    config.max_grad_norm = 5.0f;
    config.seed = 7;
    return config;
}

bool same_values(const Tensor& a, const Tensor& b) {
    if (a.getRows() != b.getRows() || a.getCols() != b.getCols()) return false;
    for (size_t i = 0; i < a.numel(); i++) {
        if (a.raw()[i] != b.raw()[i]) return false;
    }
    return true;
}

}

void test_classifier_scenario() {
    utils::print_header("Scenario: Encoder-only Classifier");

    ClassifierCorpus corpus = make_classifier_corpus();

    ModelConfig config;
    config.vocab_size = corpus.vocab.size();
    config.d_model = D_MODEL;
    config.max_len = static_cast<int>(corpus.seq_len);
    config.num_heads = 2;

    EncoderClassifier model(config, corpus.num_classes);
    training::Trainer trainer(scenario_training(500), model, corpus.dataset);
    float final_loss = trainer.train();

    const auto& history = trainer.getMetrics().loss_history();
    test::expect_true(final_loss < history.front(), "training lowers the loss");

    std::vector<int> input = pad_to(corpus.vocab.encode({"Edison", "is", "handsome"}), corpus.seq_len, corpus.pad_id);
    test::expect_true(model.predict(input) == 1, "'Edison is handsome' classified as 1");

    int correct = 0;
    for (size_t i = 0; i < corpus.dataset.size(); i++) {
        const Example& e = corpus.dataset.get_item(i);
        if (model.predict(e.input) == e.labels[0]) correct++;
    }
    std::cout << "  Training accuracy: " << correct << "/" << corpus.dataset.size() << std::endl;
}

void test_seq2seq_scenario() {
    utils::print_header("Scenario: Encoder-decoder Translator");

    TranslationCorpus corpus = make_translation_corpus();

    ModelConfig config;
    config.vocab_size = corpus.target_vocab.size();
    config.d_model = D_MODEL;
    config.max_len = 6;

    Seq2SeqModel model(config, corpus.source_vocab.size());
    training::Trainer trainer(scenario_training(300), model, corpus.dataset);
    trainer.train();

    GenerationResult lets_go = model.generate(corpus.source_vocab.encode({"let's", "go"}), corpus.sos_id, corpus.eos_id);
    std::cout << "  let's go -> " << corpus.target_vocab.decode(lets_go.tokens) << std::endl;
    test::expect_true(lets_go.reached_eos && lets_go.tokens.back() == corpus.eos_id, "generation ends with <EOS>");
    test::expect_true(lets_go.tokens.size() + 1 <= static_cast<size_t>(config.max_len), "<SOS> + output within max_len");
    test::expect_true(corpus.target_vocab.decode(lets_go.tokens) == "vamos <EOS>", "let's go -> vamos <EOS>");

    GenerationResult to_go = model.generate(corpus.source_vocab.encode({"to", "go"}), corpus.sos_id, corpus.eos_id);
    std::cout << "  to go -> " << corpus.target_vocab.decode(to_go.tokens) << std::endl;
    test::expect_true(corpus.target_vocab.decode(to_go.tokens) == "ir <EOS>", "to go -> ir <EOS>");
}

void test_decoder_only_scenario() {
    utils::print_header("Scenario: Decoder-only Generator");

    PromptCorpus corpus = make_prompt_corpus();

    ModelConfig config;
    config.vocab_size = corpus.vocab.size();
    config.d_model = D_MODEL;
    config.max_len = 6;

    DecoderOnlyModel model(config);
    training::Trainer trainer(scenario_training(300), model, corpus.dataset);
    trainer.train();

    std::vector<int> prompt = corpus.vocab.encode({"what", "is", "statquest", "<EOS>"});
    GenerationResult result = model.generate(prompt, corpus.eos_id);
    std::cout << "  " << corpus.vocab.decode(prompt) << " -> " << corpus.vocab.decode(result.tokens) << std::endl;

    test::expect_true(result.reached_eos, "emits <EOS>");
    test::expect_true(prompt.size() + result.tokens.size() <= 6, "stops at or before the 6th token");
    test::expect_true(corpus.vocab.decode(result.tokens) == "awesome <EOS>", "answers 'awesome <EOS>'");
}

// Same scenario at the 2-dimensional width of the StatQuest notebooks, with a
// larger epoch budget and step size.
void test_decoder_only_two_dimensional() {
    utils::print_header("Scenario: Decoder-only Generator (d_model = 2)");

    PromptCorpus corpus = make_prompt_corpus();

    ModelConfig config;
    config.vocab_size = corpus.vocab.size();
    config.d_model = 2;
    config.max_len = 6;

    DecoderOnlyModel model(config);
    training::TrainingConfig training_config = scenario_training(1000);
    training_config.learning_rate = 0.05f;
    training::Trainer trainer(training_config, model, corpus.dataset);
    float final_loss = trainer.train();

    const auto& history = trainer.getMetrics().loss_history();
    test::expect_true(final_loss < 0.5f * history.front(), "training at least halves the loss");

    std::vector<int> prompt = corpus.vocab.encode({"what", "is", "statquest", "<EOS>"});
    GenerationResult result = model.generate(prompt, corpus.eos_id);
    std::cout << "  " << corpus.vocab.decode(prompt) << " -> " << corpus.vocab.decode(result.tokens) << std::endl;
    test::expect_true(corpus.vocab.decode(result.tokens) == "awesome <EOS>", "answers 'awesome <EOS>'");
}

void test_determinism() {
    utils::print_header("Determinism");

    ModelConfig config;
    config.vocab_size = 5;
    config.d_model = 4;
    config.max_len = 6;

    DecoderOnlyModel first(config);
    DecoderOnlyModel second(config);
    const std::vector<int> tokens = {0, 1, 2};

    Tensor a = first.forward(tokens)->getData();
    Tensor b = first.forward(tokens)->getData();
    test::expect_true(same_values(a, b), "two forward passes give identical logits");
    test::expect_true(same_values(a, second.forward(tokens)->getData()), "same seed builds the same model");

    config.seed = 43;
    DecoderOnlyModel reseeded(config);
    test::expect_true(!same_values(a, reseeded.forward(tokens)->getData()), "a different seed builds a different model");

    test::expect_true(first.generate({0}, 4).tokens == second.generate({0}, 4).tokens, "generation is reproducible");
}

void test_generation_bound() {
    utils::print_header("Generation Bound");

    ModelConfig config;
    config.vocab_size = 5;
    config.d_model = 2;
    config.max_len = 6;

    DecoderOnlyModel model(config);
    // An id outside the vocabulary can never be produced, so only max_len stops generation.
    const int unreachable_eos = 99;

    bool bounded = true;
    for (size_t len = 1; len <= 6; len++) {
        std::vector<int> prompt(len, 0);
        GenerationResult result = model.generate(prompt, unreachable_eos);
        bounded = bounded && prompt.size() + result.tokens.size() == 6 && !result.reached_eos;
    }
    test::expect_true(bounded, "running length stops exactly at max_len");
    test::expect_throws<ShapeError>([&]() { model.generate(std::vector<int>(7, 0), unreachable_eos); },
                                    "prompt longer than max_len throws ShapeError");

    Seq2SeqModel translator([]() {
        ModelConfig c;
        c.vocab_size = 6;
        c.d_model = 2;
        c.max_len = 3;
        return c;
    }(), 4);
    GenerationResult translated = translator.generate({0, 2}, 4, 99);
    test::expect_true(translated.tokens.size() == 2, "seq2seq output fills max_len after <SOS>");
}

void test_configuration_errors() {
    utils::print_header("Configuration Errors");

    ModelConfig config;
    config.vocab_size = 5;
    config.d_model = 3;
    test::expect_throws<InvalidConfigError>([&]() { DecoderOnlyModel m(config); }, "odd d_model rejected");

    config.d_model = 2;
    config.max_len = 0;
    test::expect_throws<InvalidConfigError>([&]() { DecoderOnlyModel m(config); }, "zero max_len rejected");

    config.max_len = 6;
    config.num_heads = 0;
    test::expect_throws<InvalidConfigError>([&]() { EncoderClassifier m(config, 2); }, "zero heads rejected");

    config.num_heads = 1;
    config.vocab_size = 0;
    test::expect_throws<InvalidConfigError>([&]() { DecoderOnlyModel m(config); }, "empty vocabulary rejected");

    config.vocab_size = 5;
    test::expect_throws<InvalidConfigError>([&]() { EncoderClassifier m(config, 1); }, "single class rejected");
    test::expect_throws<InvalidConfigError>([&]() { Seq2SeqModel m(config, 0); }, "empty source vocabulary rejected");

    DecoderOnlyModel model(config);
    test::expect_throws<ShapeError>([&]() { model.forward(std::vector<int>(7, 1)); }, "sequence beyond max_len throws ShapeError");
    test::expect_throws<VocabularyError>([&]() { model.forward({1, 5}); }, "token outside vocabulary throws VocabularyError");
    test::expect_throws<ShapeError>([&]() { model.loss({1, 2}, {2}); }, "label count mismatch throws ShapeError");

    EncoderClassifier classifier(config, 2);
    Example two_labels;
    two_labels.input = {1, 2};
    two_labels.labels = {0, 1};
    test::expect_throws<ShapeError>([&]() { classifier.loss(two_labels); }, "classifier example needs exactly one label");
}

int main(int argc, char* argv[]) {
    std::cout << "Running Sanity Tests\n" << std::endl;

    try {
        if (argc > 1) {
            std::string test_name(argv[1]);
            if (test_name == "classifier") {
                test_classifier_scenario();
            } else if (test_name == "seq2seq") {
                test_seq2seq_scenario();
            } else if (test_name == "decoder") {
                test_decoder_only_scenario();
            } else if (test_name == "decoder2d") {
                test_decoder_only_two_dimensional();
            } else if (test_name == "determinism") {
                test_determinism();
            } else if (test_name == "bound") {
                test_generation_bound();
            } else if (test_name == "config") {
                test_configuration_errors();
            } else {
                std::cerr << "Unknown test: " << test_name << std::endl;
                std::cerr << "Available tests: classifier, seq2seq, decoder, decoder2d, determinism, bound, config" << std::endl;
                return 1;
            }
        } else {
            test_configuration_errors();
            test_determinism();
            test_generation_bound();
            test_classifier_scenario();
            test_seq2seq_scenario();
            test_decoder_only_scenario();
            test_decoder_only_two_dimensional();
        }
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return test::finish("Sanity");
}
