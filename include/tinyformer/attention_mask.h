#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tinyformer {

// Boolean rows x cols matrix over (query, key) pairs. true = suppress the pair.
class AttentionMask {
    private:
        size_t rows;
        size_t cols;
        std::vector<uint8_t> suppressed;
    public:
        AttentionMask(size_t rows, size_t cols);

        // (i, j) suppressed iff j > i.
        static AttentionMask causal(size_t seq_len);

        bool isSuppressed(size_t row, size_t col) const;
        void set(size_t row, size_t col, bool suppress);

        size_t getRows() const { return rows; }
        size_t getCols() const { return cols; }
};

} // namespace tinyformer
