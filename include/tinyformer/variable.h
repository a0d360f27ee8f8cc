#pragma once

#include "tensor.h"
#include "attention_mask.h"
#include <memory>
#include <functional>
#include <vector>
#include <unordered_set>

namespace tinyformer {

// Reverse-mode autodiff node. Operations build the graph eagerly; backward()
// on a scalar walks it in reverse topological order and accumulates into grad.
class Variable : public std::enable_shared_from_this<Variable> {
    private:
        Tensor data;
        Tensor grad;
        bool requires_grad;
        std::vector<std::shared_ptr<Variable>> children;
        std::function<void()> backward_fn;

    public:
        Variable(const Tensor& data, bool requires_grad = false);
        Variable(int rows, int cols, bool requires_grad = false);

        static std::shared_ptr<Variable> create(const Tensor& data, bool requires_grad = false);
        static std::shared_ptr<Variable> create(int rows, int cols, bool requires_grad = false);

        const Tensor& getData() const { return data; }
        Tensor& getData() { return data; }
        const Tensor& getGrad() const { return grad; }
        Tensor& getGrad() { return grad; }

        bool requiresGrad() const { return requires_grad; }

        std::shared_ptr<Variable> matmul(std::shared_ptr<Variable> other) const;
        std::shared_ptr<Variable> add(std::shared_ptr<Variable> other) const;
        std::shared_ptr<Variable> scale(float factor) const;
        std::shared_ptr<Variable> transpose() const;
        std::shared_ptr<Variable> softmax() const;
        std::shared_ptr<Variable> log_softmax() const;

        // Entries where mask is true are replaced by value and receive no gradient.
        std::shared_ptr<Variable> masked_fill(const AttentionMask& mask, float value) const;

        // Mean negative log-likelihood of log-probabilities [N, V] against N target ids.
        std::shared_ptr<Variable> nll_loss(const std::vector<int>& targets) const;

        static std::shared_ptr<Variable> concatenate_cols(const std::vector<std::shared_ptr<Variable>>& parts);

        void backward();
        void zeroGrad();
        void release_graph();

        void addChild(std::shared_ptr<Variable> child) { children.push_back(child); }
        void setBackwardFn(std::function<void()> fn) { backward_fn = fn; }
    private:
        void topologicalSort(std::vector<std::shared_ptr<Variable>>& sorted, std::unordered_set<const Variable*>& visited) const;
        std::shared_ptr<Variable> createOutput(const Tensor& result, bool needs_grad) const;
        std::shared_ptr<Variable> self() const;
};

} // namespace tinyformer
