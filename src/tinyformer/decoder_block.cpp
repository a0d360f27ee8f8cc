#include "tinyformer/decoder_block.h"
#include "tinyformer/attention_mask.h"
#include <stdexcept>

namespace tinyformer {

DecoderBlock::DecoderBlock(int vocab_size, int d_model, int max_len, std::mt19937& gen, bool with_cross_attention) :
    token_embedding(vocab_size, d_model, gen),
    pos_encoding(max_len, d_model),
    self_attention(d_model, gen)
{
    registerModule(token_embedding);
    registerModule(self_attention);

    if (with_cross_attention) {
        cross_attention = std::make_unique<AttentionHead>(d_model, gen);
        registerModule(*cross_attention);
    }
}

std::shared_ptr<Variable> DecoderBlock::embed(const std::vector<int>& tokens) const {
    return pos_encoding.forward(token_embedding.forward(tokens));
}

std::shared_ptr<Variable> DecoderBlock::masked_self_attention(const std::vector<int>& tokens) const {
    auto encoded = embed(tokens);
    AttentionMask mask = AttentionMask::causal(tokens.size());
    auto attended = self_attention.compute(encoded, encoded, encoded, &mask);
    return encoded->add(attended);
}

std::shared_ptr<Variable> DecoderBlock::forward(const std::vector<int>& tokens) const {
    if (cross_attention) {
        throw std::logic_error("DecoderBlock with cross-attention needs encoder keys and values");
    }
    return masked_self_attention(tokens);
}

std::shared_ptr<Variable> DecoderBlock::forward(const std::vector<int>& tokens,
                                                std::shared_ptr<Variable> encoder_keys,
                                                std::shared_ptr<Variable> encoder_values) const {
    if (!cross_attention) {
        throw std::logic_error("DecoderBlock was built without cross-attention");
    }

    auto residual = masked_self_attention(tokens);
    auto cross = cross_attention->compute(residual, encoder_keys, encoder_values);
    return residual->add(cross);
}

} // namespace tinyformer
