#include "tinyformer/attention_mask.h"
#include "tinyformer/errors.h"
#include <stdexcept>
#include <string>

namespace tinyformer {

AttentionMask::AttentionMask(size_t rows, size_t cols) :
    rows(rows),
    cols(cols),
    suppressed(rows * cols, 0)
{
    if (rows == 0 || cols == 0) {
        throw ShapeError("AttentionMask dimensions must be positive");
    }
}

AttentionMask AttentionMask::causal(size_t seq_len) {
    AttentionMask mask(seq_len, seq_len);
    for (size_t i = 0; i < seq_len; i++) {
        for (size_t j = i + 1; j < seq_len; j++) {
            mask.set(i, j, true);
        }
    }
    return mask;
}

bool AttentionMask::isSuppressed(size_t row, size_t col) const {
    if (row >= rows || col >= cols) {
        throw std::out_of_range("AttentionMask index (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") out of bounds");
    }
    return suppressed[row * cols + col] != 0;
}

void AttentionMask::set(size_t row, size_t col, bool suppress) {
    if (row >= rows || col >= cols) {
        throw std::out_of_range("AttentionMask index (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") out of bounds");
    }
    suppressed[row * cols + col] = suppress ? 1 : 0;
}

} // namespace tinyformer
