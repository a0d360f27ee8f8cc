#pragma once
#include "module.h"
#include "linear.h"
#include "attention_mask.h"
#include "variable.h"
#include <memory>
#include <random>

namespace tinyformer {

// Single scaled dot-product attention head with bias-free query/key/value
// projections, each d_model -> d_model.
class AttentionHead : public Module {
    private:
        int d_model;
        Linear W_q;
        Linear W_k;
        Linear W_v;
    public:
        AttentionHead(int d_model, std::mt19937& gen);

        // softmax(q k^T / sqrt(d_model)) with masked pairs pushed to -1e9.
        // Shape [len(q_in), len(k_in)]; every row sums to 1.
        std::shared_ptr<Variable> attention_weights(std::shared_ptr<Variable> q_in,
                                                    std::shared_ptr<Variable> k_in,
                                                    const AttentionMask* mask = nullptr) const;

        // attention_weights(...) * (v_in W_v), shape [len(q_in), d_model].
        std::shared_ptr<Variable> compute(std::shared_ptr<Variable> q_in,
                                          std::shared_ptr<Variable> k_in,
                                          std::shared_ptr<Variable> v_in,
                                          const AttentionMask* mask = nullptr) const;

        int getDModel() const { return d_model; }
        const Linear& getQuery() const { return W_q; }
        const Linear& getKey() const { return W_k; }
        const Linear& getValue() const { return W_v; }
};

} // namespace tinyformer
