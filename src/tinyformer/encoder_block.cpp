#include "tinyformer/encoder_block.h"

namespace tinyformer {

EncoderBlock::EncoderBlock(int vocab_size, int d_model, int max_len, int num_heads, std::mt19937& gen) :
    token_embedding(vocab_size, d_model, gen),
    pos_encoding(max_len, d_model),
    self_attention(d_model, num_heads, gen)
{
    registerModule(token_embedding);
    registerModule(self_attention);
}

std::shared_ptr<Variable> EncoderBlock::embed(const std::vector<int>& tokens) const {
    return pos_encoding.forward(token_embedding.forward(tokens));
}

std::shared_ptr<Variable> EncoderBlock::forward(const std::vector<int>& tokens) const {
    auto encoded = embed(tokens);
    auto attended = self_attention.compute(encoded, encoded, encoded);
    return encoded->add(attended);
}

} // namespace tinyformer
