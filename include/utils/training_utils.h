#pragma once

#include "tinyformer/variable.h"
#include <cstddef>
#include <vector>
#include <memory>

namespace utils {

// Global L2 norm over the gradients of trainable parameters.
float compute_grad_norm(const std::vector<std::shared_ptr<tinyformer::Variable>>& params);

// Number of trainable scalars.
size_t count_parameters(const std::vector<std::shared_ptr<tinyformer::Variable>>& params);

size_t get_memory_mb();

} // namespace utils
