#include "tinyformer/optimizer.h"
#include "tinyformer/blas_wrapper.h"
#include "tinyformer/errors.h"
#include <cmath>
#include <string>

namespace tinyformer {

namespace {

void check_learning_rate(float lr) {
    if (!(lr > 0.0f)) {
        throw InvalidConfigError("learning rate must be positive, got " + std::to_string(lr));
    }
}

}

SGDOptimizer::SGDOptimizer(const std::vector<std::shared_ptr<Variable>>& parameters, float lr) :
    learning_rate(lr), parameters(parameters)
{
    check_learning_rate(lr);
}

void SGDOptimizer::step() {
    for (auto& param : parameters) {
        if (!param->requiresGrad()) continue;

        Tensor& data = param->getData();
        const Tensor& grad = param->getGrad();

        const size_t n = data.numel();
        float* dptr = data.raw();
        const float* gptr = grad.raw();

        for (size_t i = 0; i < n; i++) {
            dptr[i] -= learning_rate * gptr[i];
        }
    }
}

void SGDOptimizer::zero_grad() {
    for (auto& param : parameters) {
        param->zeroGrad();
    }
}

AdamOptimizer::AdamOptimizer(const std::vector<std::shared_ptr<Variable>>& parameters, float lr, float beta1, float beta2, float epsilon, float weight_decay) : parameters_(parameters), lr_(lr), base_lr_(lr), beta1_(beta1), beta2_(beta2), epsilon_(epsilon), weight_decay_(weight_decay), step_count_(0), warmup_steps_(0) {
    check_learning_rate(lr);
    if (beta1 < 0.0f || beta1 >= 1.0f || beta2 < 0.0f || beta2 >= 1.0f) {
        throw InvalidConfigError("Adam betas must lie in [0, 1)");
    }
    if (!(epsilon > 0.0f)) {
        throw InvalidConfigError("Adam epsilon must be positive");
    }
    if (weight_decay < 0.0f) {
        throw InvalidConfigError("weight_decay must be non-negative");
    }
}

void AdamOptimizer::step() {
    step_count_++;

    if (warmup_steps_ > 0 && step_count_ <= warmup_steps_) {
        lr_ = base_lr_ * (static_cast<float>(step_count_) / warmup_steps_);
    } else {
        lr_ = base_lr_;
    }

    const float bc1 = 1.0f - std::pow(beta1_, step_count_);
    const float bc2 = 1.0f - std::pow(beta2_, step_count_);
    const float inv_bc1 = 1.0f / bc1;
    const float inv_bc2 = 1.0f / bc2;

    const float lr  = lr_;
    const float eps = epsilon_;
    const float wd  = weight_decay_;
    const float b1  = beta1_;
    const float b2  = beta2_;

    for (auto& param : parameters_) {
        if (!param->requiresGrad()) continue;

        Tensor& data = param->getData();
        const Tensor& grad = param->getGrad();
        Variable* param_ptr = param.get();

        if (m_.find(param_ptr) == m_.end()) {
            m_[param_ptr] = Tensor(data.getRows(), data.getCols());
            v_[param_ptr] = Tensor(data.getRows(), data.getCols());
        }

        Tensor& m = m_[param_ptr];
        Tensor& v = v_[param_ptr];

        const size_t n = data.numel();
        float* dptr = data.raw();
        const float* gptr = grad.raw();
        float* mptr = m.raw();
        float* vptr = v.raw();

        for (size_t i = 0; i < n; ++i) {
            float g = gptr[i];
            if (wd > 0.0f) {
                g += wd * dptr[i];
            }

            float mi = mptr[i] = b1 * mptr[i] + (1.0f - b1) * g;
            float vi = vptr[i] = b2 * vptr[i] + (1.0f - b2) * (g * g);

            float m_hat = mi * inv_bc1;
            float v_hat = vi * inv_bc2;

            dptr[i] -= lr * m_hat / (std::sqrt(v_hat) + eps);
        }
    }
}

void AdamOptimizer::zero_grad() {
    for (auto& param : parameters_) {
        param->zeroGrad();
    }
}

float AdamOptimizer::clip_grad_norm(float max_norm) {
    float total_sq = 0.0f;
    for (auto& param : parameters_) {
        if (!param->requiresGrad()) continue;
        const Tensor& grad = param->getGrad();
        total_sq += blas_sumsq(grad.raw(), grad.numel());
    }
    const float total_norm = std::sqrt(total_sq);

    if (total_norm > max_norm) {
        const float clip_coef = max_norm / (total_norm + 1e-6f);

        for (auto& param : parameters_) {
            if (!param->requiresGrad()) continue;
            Tensor& grad = param->getGrad();
            blas_vsmul(grad.raw(), clip_coef, grad.raw(), grad.numel());
        }
    }
    return total_norm;
}

} // namespace tinyformer
