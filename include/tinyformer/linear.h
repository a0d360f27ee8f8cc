#pragma once
#include "module.h"
#include "tensor.h"
#include "variable.h"
#include <memory>
#include <random>

namespace tinyformer {

// y = x W (+ b). W is [input_dim, output_dim], xavier-initialised; b starts at zero.
class Linear : public Module {
    private:
        int input_dim;
        int output_dim;
        bool use_bias;
        std::shared_ptr<Variable> weights;
        std::shared_ptr<Variable> bias;
    public:
        Linear(int input_dim, int output_dim, std::mt19937& gen, bool use_bias = true);

        std::shared_ptr<Variable> forward(std::shared_ptr<Variable> input) const;

        std::shared_ptr<Variable> getWeights() const { return weights; }
        std::shared_ptr<Variable> getBias() const { return bias; }
        int getInputDim() const { return input_dim; }
        int getOutputDim() const { return output_dim; }
};

} // namespace tinyformer
