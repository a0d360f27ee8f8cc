#include "tinyformer/encoder_classifier.h"
#include "tinyformer/seq2seq_model.h"
#include "tinyformer/decoder_only_model.h"
#include "data/toy_corpora.h"
#include "training/trainer.h"
#include "utils/metrics.h"
#include <iostream>
#include <vector>
#include <string>
#include <chrono>

namespace {

// 2 reproduces the original teaching setup; 16 converges far more reliably.
const bool NOTEBOOK_SIZE = false;
const int D_MODEL = NOTEBOOK_SIZE ? 2 : 16;

training::TrainingConfig demo_training_config(int num_epochs) {
    training::TrainingConfig config;
    config.learning_rate = 0.02f;
    config.num_epochs = num_epochs;
    config.log_interval = num_epochs / 5;
    config.max_grad_norm = 5.0f;
    return config;
}

void run_classifier() {
    utils::print_section("Encoder-only classifier");

    tinyformer::ClassifierCorpus corpus = tinyformer::make_classifier_corpus();

    tinyformer::ModelConfig config;
    config.vocab_size = corpus.vocab.size();
    config.d_model = D_MODEL;
    config.max_len = static_cast<int>(corpus.seq_len);
    config.num_heads = 2;

    tinyformer::EncoderClassifier model(config, corpus.num_classes);
    training::Trainer trainer(demo_training_config(500), model, corpus.dataset);
    trainer.train();

    std::cout << "\nPredictions:" << std::endl;
    for (size_t i = 0; i < corpus.dataset.size(); i++) {
        const tinyformer::Example& example = corpus.dataset.get_item(i);
        std::cout << "  " << corpus.vocab.decode(example.input)
                  << " -> " << model.predict(example.input)
                  << " (label " << example.labels[0] << ")" << std::endl;
    }
}

void run_translation() {
    utils::print_section("Encoder-decoder translator");

    tinyformer::TranslationCorpus corpus = tinyformer::make_translation_corpus();

    tinyformer::ModelConfig config;
    config.vocab_size = corpus.target_vocab.size();
    config.d_model = D_MODEL;
    config.max_len = 6;

    tinyformer::Seq2SeqModel model(config, corpus.source_vocab.size());
    training::Trainer trainer(demo_training_config(300), model, corpus.dataset);
    trainer.train();

    std::cout << "\nTranslations:" << std::endl;
    for (size_t i = 0; i < corpus.dataset.size(); i++) {
        const tinyformer::Example& example = corpus.dataset.get_item(i);
        tinyformer::GenerationResult result = model.generate(example.input, corpus.sos_id, corpus.eos_id);
        std::cout << "  " << corpus.source_vocab.decode(example.input)
                  << " -> " << corpus.target_vocab.decode(result.tokens)
                  << (result.reached_eos ? "" : "  [no <EOS> before max_len]") << std::endl;
    }
}

void run_generator() {
    utils::print_section("Decoder-only generator");

    tinyformer::PromptCorpus corpus = tinyformer::make_prompt_corpus();

    tinyformer::ModelConfig config;
    config.vocab_size = corpus.vocab.size();
    config.d_model = D_MODEL;
    config.max_len = 6;

    tinyformer::DecoderOnlyModel model(config);
    training::Trainer trainer(demo_training_config(300), model, corpus.dataset);
    trainer.train();

    std::cout << "\nGenerations:" << std::endl;
    const std::vector<std::vector<std::string>> prompts = {
        {"what", "is", "statquest", "<EOS>"},
        {"statquest", "is", "what", "<EOS>"},
    };
    for (const auto& words : prompts) {
        std::vector<int> prompt = corpus.vocab.encode(words);
        tinyformer::GenerationResult result = model.generate(prompt, corpus.eos_id);
        std::cout << "  " << corpus.vocab.decode(prompt)
                  << " -> " << corpus.vocab.decode(result.tokens) << std::endl;
    }
}

}

int main() {
    std::cout << "\ntinyformer toy scenarios (d_model=" << D_MODEL << ")\n" << std::endl;

    try {
        auto start = std::chrono::high_resolution_clock::now();

        run_classifier();
        run_translation();
        run_generator();

        auto end = std::chrono::high_resolution_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        std::cout << "\nAll scenarios done (" << ms << "ms)\n" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
