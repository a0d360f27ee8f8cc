#pragma once
#include "dataset.h"
#include "../tinyformer/vocabulary.h"
#include <cstddef>
#include <vector>

namespace tinyformer {

// Pads ids with pad_id up to length; throws ShapeError if ids is longer.
std::vector<int> pad_to(std::vector<int> ids, size_t length, int pad_id);

// Seven short sentences labelled 1 (positive) or 0 (negative), padded to 6 tokens.
struct ClassifierCorpus {
    Vocabulary vocab;
    ExampleDataset dataset;
    int num_classes;
    int pad_id;
    size_t seq_len;
};

// "let's go" -> "vamos", "to go" -> "ir".
struct TranslationCorpus {
    Vocabulary source_vocab;
    Vocabulary target_vocab;
    ExampleDataset dataset;
    int sos_id;
    int eos_id;
};

// Two prompt/answer sequences: "what is statquest <EOS> awesome <EOS>" and
// "statquest is what <EOS> awesome <EOS>".
struct PromptCorpus {
    Vocabulary vocab;
    ExampleDataset dataset;
    int eos_id;
};

ClassifierCorpus make_classifier_corpus();
TranslationCorpus make_translation_corpus();
PromptCorpus make_prompt_corpus();

} // namespace tinyformer
