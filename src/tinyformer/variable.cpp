#include "tinyformer/variable.h"
#include "tinyformer/errors.h"
#include <cmath>
#include <iostream>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace tinyformer {

Variable::Variable(const Tensor& data, bool requires_grad)
    : data(data), requires_grad(requires_grad) {
    if (requires_grad) {
        grad = Tensor(data.getRows(), data.getCols());
    }
}

Variable::Variable(int rows, int cols, bool requires_grad)
    : data(rows, cols), requires_grad(requires_grad) {
    if (requires_grad) {
        grad = Tensor(rows, cols);
    }
}

std::shared_ptr<Variable> Variable::create(const Tensor& data, bool requires_grad) {
    return std::make_shared<Variable>(data, requires_grad);
}

std::shared_ptr<Variable> Variable::create(int rows, int cols, bool requires_grad) {
    return std::make_shared<Variable>(rows, cols, requires_grad);
}

std::shared_ptr<Variable> Variable::createOutput(const Tensor& result, bool needs_grad) const {
    return std::make_shared<Variable>(result, needs_grad);
}

std::shared_ptr<Variable> Variable::self() const {
    return std::const_pointer_cast<Variable>(shared_from_this());
}

std::shared_ptr<Variable> Variable::matmul(std::shared_ptr<Variable> other) const {
    Tensor result = this->data.matmul(other->data);
    bool needs_grad = this->requires_grad || other->requires_grad;

    auto output = createOutput(result, needs_grad);

    if (needs_grad) {
        auto self_ptr = self();

        output->addChild(self_ptr);
        output->addChild(other);

        output->setBackwardFn([self_ptr, other, output_weak = std::weak_ptr<Variable>(output)]() {
            auto output = output_weak.lock();
            if (!output) return;
            if (self_ptr->requires_grad) {
                self_ptr->grad.add_inplace(output->grad.matmul(other->data.transpose()));
            }
            if (other->requires_grad) {
                other->grad.add_inplace(self_ptr->data.transpose().matmul(output->grad));
            }
        });
    }
    return output;
}

namespace {

// Sum a [GR, GC] upstream gradient down to the [R, C] shape of a broadcast operand.
Tensor reduce_broadcast(const Tensor& g, size_t R, size_t C) {
    if (g.getRows() == R && g.getCols() == C) {
        return g;
    }

    const bool br = (R == 1) && (g.getRows() > 1);
    const bool bc = (C == 1) && (g.getCols() > 1);
    const size_t GR = g.getRows();
    const size_t GC = g.getCols();

    Tensor out(R, C);
    const float* g_ptr = g.raw();
    float* out_ptr = out.raw();

    for (size_t i = 0; i < GR; ++i) {
        const size_t oi = br ? 0 : i;
        for (size_t j = 0; j < GC; ++j) {
            const size_t oj = bc ? 0 : j;
            out_ptr[oi * C + oj] += g_ptr[i * GC + j];
        }
    }
    return out;
}

}

std::shared_ptr<Variable> Variable::add(std::shared_ptr<Variable> other) const {
    Tensor result = this->data.add(other->data);
    bool needs_grad = this->requires_grad || other->requires_grad;
    auto output = createOutput(result, needs_grad);

    if (needs_grad) {
        auto self_ptr = self();

        output->addChild(self_ptr);
        output->addChild(other);

        output->setBackwardFn([self_ptr, other, output_weak = std::weak_ptr<Variable>(output)]() {
            auto output = output_weak.lock();
            if (!output) return;
            const Tensor& dO = output->grad;

            if (self_ptr->requires_grad) {
                self_ptr->grad.add_inplace(
                    reduce_broadcast(dO, self_ptr->data.getRows(), self_ptr->data.getCols()));
            }
            if (other->requires_grad) {
                other->grad.add_inplace(
                    reduce_broadcast(dO, other->data.getRows(), other->data.getCols()));
            }
        });
    }
    return output;
}

std::shared_ptr<Variable> Variable::scale(float factor) const {
    Tensor result = this->data.scale(factor);
    auto output = createOutput(result, this->requires_grad);

    if (this->requires_grad) {
        auto self_ptr = self();

        output->addChild(self_ptr);
        output->setBackwardFn([self_ptr, factor, output_weak = std::weak_ptr<Variable>(output)]() {
            auto output = output_weak.lock();
            if (!output) return;
            self_ptr->grad.add_inplace(output->grad.scale(factor));
        });
    }
    return output;
}

std::shared_ptr<Variable> Variable::transpose() const {
    Tensor result = this->data.transpose();
    auto output = createOutput(result, this->requires_grad);

    if (this->requires_grad) {
        auto self_ptr = self();

        output->addChild(self_ptr);
        output->setBackwardFn([self_ptr, output_weak = std::weak_ptr<Variable>(output)]() {
            auto output = output_weak.lock();
            if (!output) return;
            self_ptr->grad.add_inplace(output->grad.transpose());
        });
    }
    return output;
}

std::shared_ptr<Variable> Variable::softmax() const {
    Tensor result = this->data.softmax();
    auto output = createOutput(result, this->requires_grad);

    if (this->requires_grad) {
        auto self_ptr = self();

        output->addChild(self_ptr);
        output->setBackwardFn([self_ptr, result, output_weak = std::weak_ptr<Variable>(output)]() {
            auto output = output_weak.lock();
            if (!output) return;

            const size_t rows = result.getRows();
            const size_t cols = result.getCols();
            Tensor temp_grad(rows, cols);
            const float* result_data = result.raw();
            const float* grad_out_data = output->grad.raw();
            float* temp_grad_data = temp_grad.raw();

            for (size_t i = 0; i < rows; i++) {
                const float* row_result = result_data + i * cols;
                const float* row_grad_out = grad_out_data + i * cols;
                float* row_grad = temp_grad_data + i * cols;

                float dot_product = 0.0f;
                for (size_t j = 0; j < cols; j++) {
                    dot_product += row_result[j] * row_grad_out[j];
                }

                for (size_t j = 0; j < cols; j++) {
                    row_grad[j] = row_result[j] * (row_grad_out[j] - dot_product);
                }
            }
            self_ptr->grad.add_inplace(temp_grad);
        });
    }
    return output;
}

std::shared_ptr<Variable> Variable::log_softmax() const {
    Tensor result = this->data;
    const size_t rows = result.getRows();
    const size_t cols = result.getCols();

    const float* input_data = this->data.raw();
    float* result_data = result.raw();

    for (size_t i = 0; i < rows; i++) {
        const float* row_in = input_data + i * cols;
        float* row_out = result_data + i * cols;

        float max_val = row_in[0];
        for (size_t j = 1; j < cols; j++) {
            max_val = std::max(max_val, row_in[j]);
        }

        float sum_exp = 0.0f;
        for (size_t j = 0; j < cols; j++) {
            sum_exp += std::exp(row_in[j] - max_val);
        }
        float log_sum = std::log(sum_exp) + max_val;

        for (size_t j = 0; j < cols; j++) {
            row_out[j] = row_in[j] - log_sum;
        }
    }

    auto output = createOutput(result, this->requires_grad);

    if (this->requires_grad) {
        auto self_ptr = self();
        output->addChild(self_ptr);

        output->setBackwardFn([self_ptr, result, output_weak = std::weak_ptr<Variable>(output)]() {
            auto output = output_weak.lock();
            if (!output) return;

            const size_t rows = result.getRows();
            const size_t cols = result.getCols();
            Tensor grad(rows, cols);
            const float* result_data = result.raw();
            const float* grad_output_data = output->grad.raw();
            float* grad_data = grad.raw();

            for (size_t i = 0; i < rows; i++) {
                const float* row_result = result_data + i * cols;
                const float* row_grad_out = grad_output_data + i * cols;
                float* row_grad = grad_data + i * cols;

                float sum = 0.0f;
                for (size_t j = 0; j < cols; j++) {
                    sum += row_grad_out[j];
                }

                for (size_t j = 0; j < cols; j++) {
                    float softmax_val = std::exp(row_result[j]);
                    row_grad[j] = row_grad_out[j] - softmax_val * sum;
                }
            }
            self_ptr->grad.add_inplace(grad);
        });
    }
    return output;
}

std::shared_ptr<Variable> Variable::masked_fill(const AttentionMask& mask, float value) const {
    if (mask.getRows() != data.getRows() || mask.getCols() != data.getCols()) {
        throw ShapeError("Mask shape (" + std::to_string(mask.getRows()) + "x" + std::to_string(mask.getCols()) +
                         ") does not match scores (" + std::to_string(data.getRows()) + "x" +
                         std::to_string(data.getCols()) + ")");
    }

    Tensor result = this->data;
    Tensor keep(data.getRows(), data.getCols());
    for (size_t i = 0; i < data.getRows(); i++) {
        for (size_t j = 0; j < data.getCols(); j++) {
            if (mask.isSuppressed(i, j)) {
                result.setValue(i, j, value);
            } else {
                keep.setValue(i, j, 1.0f);
            }
        }
    }

    auto output = createOutput(result, this->requires_grad);

    if (this->requires_grad) {
        auto self_ptr = self();
        output->addChild(self_ptr);
        output->setBackwardFn([self_ptr, keep, output_weak = std::weak_ptr<Variable>(output)]() {
            auto output = output_weak.lock();
            if (!output) return;
            self_ptr->grad.add_inplace(output->grad.elementwise(keep));
        });
    }
    return output;
}

std::shared_ptr<Variable> Variable::nll_loss(const std::vector<int>& targets) const {
    const size_t n = data.getRows();
    const size_t vocab = data.getCols();

    if (targets.size() != n) {
        throw ShapeError("nll_loss: " + std::to_string(targets.size()) + " targets for " +
                         std::to_string(n) + " rows");
    }

    float total_loss = 0.0f;
    for (size_t i = 0; i < n; i++) {
        int target_idx = targets[i];
        if (target_idx < 0 || static_cast<size_t>(target_idx) >= vocab) {
            throw VocabularyError("nll_loss: target id " + std::to_string(target_idx) +
                                  " outside [0, " + std::to_string(vocab) + ")");
        }
        total_loss -= data.getValue(i, target_idx);
    }
    total_loss /= n;

    Tensor loss_tensor(1, 1);
    loss_tensor.setValue(0, 0, total_loss);
    auto output = createOutput(loss_tensor, this->requires_grad);

    if (this->requires_grad) {
        auto self_ptr = self();
        output->addChild(self_ptr);

        output->setBackwardFn([self_ptr, targets, n, output_weak = std::weak_ptr<Variable>(output)]() {
            auto output = output_weak.lock();
            if (!output) return;
            Tensor grad(self_ptr->data.getRows(), self_ptr->data.getCols());
            float scale = -output->grad.getValue(0, 0) / n;

            for (size_t i = 0; i < n; i++) {
                grad.setValue(i, targets[i], scale);
            }
            self_ptr->grad.add_inplace(grad);
        });
    }
    return output;
}

std::shared_ptr<Variable> Variable::concatenate_cols(const std::vector<std::shared_ptr<Variable>>& parts) {
    if (parts.empty()) {
        throw ShapeError("concatenate_cols: no inputs");
    }

    Tensor result = parts[0]->data;
    bool needs_grad = parts[0]->requires_grad;
    for (size_t p = 1; p < parts.size(); p++) {
        result = result.concatenate_cols(parts[p]->data);
        needs_grad = needs_grad || parts[p]->requires_grad;
    }

    auto output = std::make_shared<Variable>(result, needs_grad);

    if (needs_grad) {
        for (const auto& part : parts) {
            output->addChild(part);
        }

        output->setBackwardFn([parts, output_weak = std::weak_ptr<Variable>(output)]() {
            auto output = output_weak.lock();
            if (!output) return;
            size_t col_offset = 0;
            for (const auto& part : parts) {
                const size_t width = part->data.getCols();
                if (part->requires_grad) {
                    part->grad.add_inplace(output->grad.slice(0, output->grad.getRows(), col_offset, width));
                }
                col_offset += width;
            }
        });
    }
    return output;
}

void Variable::topologicalSort(std::vector<std::shared_ptr<Variable>>& sorted, std::unordered_set<const Variable*>& visited) const {
    if (visited.find(this) != visited.end()) {
        return;
    }

    visited.insert(this);

    for (const auto& child : children) {
        child->topologicalSort(sorted, visited);
    }

    sorted.push_back(self());
}

void Variable::backward() {
    if (!requires_grad) {
        std::cerr << "Warning: backward() called on Variable that doesn't require grad" << std::endl;
        return;
    }

    if (data.numel() != 1) {
        throw std::runtime_error("Variable::backward(): output must be scalar to auto-seed dOut=1");
    }
    grad.fill(1.0f);

    std::vector<std::shared_ptr<Variable>> sorted;
    std::unordered_set<const Variable*> visited;
    topologicalSort(sorted, visited);

    for (auto it = sorted.rbegin(); it != sorted.rend(); ++it) {
        if ((*it)->backward_fn) {
            (*it)->backward_fn();
        }
    }
}

void Variable::zeroGrad() {
    if (requires_grad) {
        grad.fill(0.0f);
    }
}

void Variable::release_graph() {
    for (auto& child : children) {
        if (child) {
            child->release_graph();
        }
    }

    children.clear();
    backward_fn = nullptr;
}

} // namespace tinyformer
