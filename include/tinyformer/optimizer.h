#pragma once
#include "variable.h"
#include "tensor.h"
#include <vector>
#include <memory>
#include <unordered_map>

namespace tinyformer {

class Optimizer {
    public:
        virtual ~Optimizer() = default;
        virtual void step() = 0;
        virtual void zero_grad() = 0;
};

class SGDOptimizer : public Optimizer {
    private:
        float learning_rate;
        std::vector<std::shared_ptr<Variable>> parameters;
    public:
        SGDOptimizer(const std::vector<std::shared_ptr<Variable>>& parameters, float lr);

        void step() override;
        void zero_grad() override;
};

// Bias-corrected Adam with optional L2 weight decay and linear warmup.
class AdamOptimizer : public Optimizer {
    private:
        std::vector<std::shared_ptr<Variable>> parameters_;
        float lr_;
        float base_lr_;
        float beta1_;
        float beta2_;
        float epsilon_;
        float weight_decay_;
        int step_count_;
        int warmup_steps_;

        std::unordered_map<Variable*, Tensor> m_;
        std::unordered_map<Variable*, Tensor> v_;
    public:
        AdamOptimizer(const std::vector<std::shared_ptr<Variable>>& parameters, float lr = 3e-4f, float beta1 = 0.9f, float beta2 = 0.999f, float epsilon = 1e-8f, float weight_decay = 0.0f);

        void step() override;
        void zero_grad() override;

        // Rescales all gradients so their global L2 norm is at most max_norm.
        // Returns the norm before clipping.
        float clip_grad_norm(float max_norm);

        void set_warmup_steps(int steps) { warmup_steps_ = steps; }
        int getStepCount() const { return step_count_; }
        float getLearningRate() const { return lr_; }
};

} // namespace tinyformer
