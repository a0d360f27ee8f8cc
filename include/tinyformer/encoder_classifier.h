#pragma once
#include "sequence_model.h"
#include "encoder_block.h"
#include "linear.h"
#include <memory>
#include <random>
#include <vector>

namespace tinyformer {

// Encoder-only sequence classifier. The encoder output is mean-pooled over
// positions and mapped to num_classes logits.
class EncoderClassifier : public SequenceModel {
    private:
        int num_classes;
        std::mt19937 init_rng;
        EncoderBlock encoder;
        Linear classifier_head;
    public:
        EncoderClassifier(const ModelConfig& config, int num_classes);

        // [1, num_classes]
        std::shared_ptr<Variable> forward(const std::vector<int>& tokens) const;
        int predict(const std::vector<int>& tokens) const;

        std::shared_ptr<Variable> loss(const std::vector<int>& tokens, int label) const;
        std::shared_ptr<Variable> loss(const Example& example) const override;

        int getNumClasses() const { return num_classes; }
        const EncoderBlock& getEncoder() const { return encoder; }
};

} // namespace tinyformer
