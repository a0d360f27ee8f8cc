#include "tinyformer/linear.h"
#include "tinyformer/errors.h"
#include <string>

namespace tinyformer {

Linear::Linear(int input_dim, int output_dim, std::mt19937& gen, bool use_bias) :
    input_dim(input_dim),
    output_dim(output_dim),
    use_bias(use_bias)
{
    if (input_dim <= 0 || output_dim <= 0) {
        throw InvalidConfigError("Linear dimensions must be positive, got " +
                                 std::to_string(input_dim) + " -> " + std::to_string(output_dim));
    }

    Tensor w_tensor(input_dim, output_dim);
    w_tensor.xavier(input_dim, output_dim, gen);
    weights = Variable::create(w_tensor, true);
    registerParameter(weights);

    if (use_bias) {
        Tensor b_tensor(1, output_dim);
        bias = Variable::create(b_tensor, true);
        registerParameter(bias);
    }
}

std::shared_ptr<Variable> Linear::forward(std::shared_ptr<Variable> input) const {
    if (static_cast<int>(input->getData().getCols()) != input_dim) {
        throw ShapeError("Linear expects width " + std::to_string(input_dim) +
                         ", got " + std::to_string(input->getData().getCols()));
    }
    auto result = input->matmul(weights);
    if (use_bias) {
        result = result->add(bias);
    }
    return result;
}

} // namespace tinyformer
