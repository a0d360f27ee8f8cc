#pragma once
#include "sequence_model.h"
#include "decoder_block.h"
#include "greedy_decoder.h"
#include "linear.h"
#include <memory>
#include <random>
#include <vector>

namespace tinyformer {

// Decoder-only next-token generator: causal self-attention block + output head.
class DecoderOnlyModel : public SequenceModel {
    private:
        std::mt19937 init_rng;
        DecoderBlock decoder;
        Linear output_head;
    public:
        explicit DecoderOnlyModel(const ModelConfig& config);

        // Logits [len(tokens), vocab_size].
        std::shared_ptr<Variable> forward(const std::vector<int>& tokens) const;

        std::shared_ptr<Variable> loss(const std::vector<int>& tokens, const std::vector<int>& labels) const;
        std::shared_ptr<Variable> loss(const Example& example) const override;

        GenerationResult generate(const std::vector<int>& prompt, int eos_id) const;

        const DecoderBlock& getDecoder() const { return decoder; }
};

} // namespace tinyformer
