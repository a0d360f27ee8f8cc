#include "tinyformer/attention.h"
#include "tinyformer/errors.h"
#include <cmath>
#include <string>

namespace tinyformer {

namespace {

constexpr float MASKED_SCORE = -1e9f;

void check_width(const std::shared_ptr<Variable>& input, int d_model, const char* name) {
    if (static_cast<int>(input->getData().getCols()) != d_model) {
        throw ShapeError(std::string("Attention ") + name + " width " +
                         std::to_string(input->getData().getCols()) +
                         " does not match d_model " + std::to_string(d_model));
    }
}

}

AttentionHead::AttentionHead(int d_model, std::mt19937& gen) :
    d_model(d_model),
    W_q(d_model, d_model, gen, false),
    W_k(d_model, d_model, gen, false),
    W_v(d_model, d_model, gen, false)
{
    registerModule(W_q);
    registerModule(W_k);
    registerModule(W_v);
}

std::shared_ptr<Variable> AttentionHead::attention_weights(std::shared_ptr<Variable> q_in,
                                                           std::shared_ptr<Variable> k_in,
                                                           const AttentionMask* mask) const {
    check_width(q_in, d_model, "query");
    check_width(k_in, d_model, "key");

    auto q = W_q.forward(q_in);
    auto k = W_k.forward(k_in);

    auto scores = q->matmul(k->transpose())->scale(1.0f / std::sqrt(static_cast<float>(d_model)));

    if (mask != nullptr) {
        scores = scores->masked_fill(*mask, MASKED_SCORE);
    }

    return scores->softmax();
}

std::shared_ptr<Variable> AttentionHead::compute(std::shared_ptr<Variable> q_in,
                                                 std::shared_ptr<Variable> k_in,
                                                 std::shared_ptr<Variable> v_in,
                                                 const AttentionMask* mask) const {
    check_width(v_in, d_model, "value");
    if (k_in->getData().getRows() != v_in->getData().getRows()) {
        throw ShapeError("Attention keys (" + std::to_string(k_in->getData().getRows()) +
                         " rows) and values (" + std::to_string(v_in->getData().getRows()) +
                         " rows) differ in length");
    }

    auto weights = attention_weights(q_in, k_in, mask);
    auto v = W_v.forward(v_in);
    return weights->matmul(v);
}

} // namespace tinyformer
