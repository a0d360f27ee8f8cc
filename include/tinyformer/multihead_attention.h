#pragma once
#include "module.h"
#include "attention.h"
#include "linear.h"
#include "variable.h"
#include <memory>
#include <random>
#include <vector>

namespace tinyformer {

// num_heads independent full-width heads. Outputs are concatenated to
// [L, num_heads * d_model] and projected back to d_model by a learned
// Linear. This is not the split-d_model formulation: every head sees the
// whole embedding, so parameter count grows with num_heads.
// A single head is returned as-is with no projection.
class MultiHeadAttention : public Module {
    private:
        int d_model;
        int num_heads;
        std::vector<std::unique_ptr<AttentionHead>> heads;
        std::unique_ptr<Linear> unify_heads;
    public:
        MultiHeadAttention(int d_model, int num_heads, std::mt19937& gen);

        std::shared_ptr<Variable> compute(std::shared_ptr<Variable> q_in,
                                          std::shared_ptr<Variable> k_in,
                                          std::shared_ptr<Variable> v_in,
                                          const AttentionMask* mask = nullptr) const;

        int getNumHeads() const { return num_heads; }
        int getDModel() const { return d_model; }
        const AttentionHead& getHead(int index) const { return *heads.at(index); }
        const Linear* getUnifyHeads() const { return unify_heads.get(); }
};

} // namespace tinyformer
