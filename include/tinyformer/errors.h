#pragma once
#include <stdexcept>
#include <string>

namespace tinyformer {

// Dimension mismatch: embedding width vs d_model, sequence longer than the
// positional table, incompatible matrix or mask shapes.
class ShapeError : public std::invalid_argument {
    public:
        explicit ShapeError(const std::string& what) : std::invalid_argument(what) {}
};

// Rejected at construction: odd d_model, non-positive max_len or head count,
// bad training hyper-parameters.
class InvalidConfigError : public std::invalid_argument {
    public:
        explicit InvalidConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Token id or token text outside the vocabulary.
class VocabularyError : public std::out_of_range {
    public:
        explicit VocabularyError(const std::string& what) : std::out_of_range(what) {}
};

} // namespace tinyformer
