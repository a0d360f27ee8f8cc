#pragma once
#include <string>

namespace tinyformer {

struct ModelConfig {
    int vocab_size = 0;
    int d_model = 2;
    int max_len = 6;
    int num_heads = 1;
    unsigned int seed = 42;

    // Throws InvalidConfigError.
    void validate() const;
    std::string describe() const;
};

} // namespace tinyformer
