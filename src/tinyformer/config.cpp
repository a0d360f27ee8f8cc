#include "tinyformer/config.h"
#include "tinyformer/errors.h"
#include <sstream>

namespace tinyformer {

void ModelConfig::validate() const {
    if (vocab_size <= 0) {
        throw InvalidConfigError("vocab_size must be positive, got " + std::to_string(vocab_size));
    }
    if (d_model < 2 || d_model % 2 != 0) {
        throw InvalidConfigError("d_model must be even and >= 2, got " + std::to_string(d_model));
    }
    if (max_len < 1) {
        throw InvalidConfigError("max_len must be >= 1, got " + std::to_string(max_len));
    }
    if (num_heads < 1) {
        throw InvalidConfigError("num_heads must be >= 1, got " + std::to_string(num_heads));
    }
}

std::string ModelConfig::describe() const {
    std::ostringstream out;
    out << "vocab_size=" << vocab_size
        << " d_model=" << d_model
        << " max_len=" << max_len
        << " heads=" << num_heads
        << " seed=" << seed;
    return out.str();
}

} // namespace tinyformer
