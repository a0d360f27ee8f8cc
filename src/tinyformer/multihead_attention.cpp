#include "tinyformer/multihead_attention.h"
#include "tinyformer/errors.h"
#include <string>

namespace tinyformer {

MultiHeadAttention::MultiHeadAttention(int d_model, int num_heads, std::mt19937& gen) :
    d_model(d_model),
    num_heads(num_heads)
{
    if (num_heads <= 0) {
        throw InvalidConfigError("num_heads must be positive, got " + std::to_string(num_heads));
    }

    heads.reserve(num_heads);
    for (int h = 0; h < num_heads; h++) {
        heads.push_back(std::make_unique<AttentionHead>(d_model, gen));
        registerModule(*heads.back());
    }

    if (num_heads > 1) {
        unify_heads = std::make_unique<Linear>(num_heads * d_model, d_model, gen);
        registerModule(*unify_heads);
    }
}

std::shared_ptr<Variable> MultiHeadAttention::compute(std::shared_ptr<Variable> q_in,
                                                      std::shared_ptr<Variable> k_in,
                                                      std::shared_ptr<Variable> v_in,
                                                      const AttentionMask* mask) const {
    if (num_heads == 1) {
        return heads[0]->compute(q_in, k_in, v_in, mask);
    }

    std::vector<std::shared_ptr<Variable>> head_outputs;
    head_outputs.reserve(num_heads);
    for (int h = 0; h < num_heads; h++) {
        head_outputs.push_back(heads[h]->compute(q_in, k_in, v_in, mask));
    }

    auto concat = Variable::concatenate_cols(head_outputs);
    return unify_heads->forward(concat);
}

} // namespace tinyformer
