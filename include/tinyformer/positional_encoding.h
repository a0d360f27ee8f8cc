#pragma once

#include "tensor.h"
#include "variable.h"
#include <memory>

namespace tinyformer {

// Fixed sinusoidal position signal:
//   table(pos, 2i)   = sin(pos / 10000^(2i/d_model))
//   table(pos, 2i+1) = cos(pos / 10000^(2i/d_model))
// The table is computed once and never trained.
class PositionalEncoding {
    private:
        int max_len;
        int d_model;
        Tensor encoding_table;

        void computeEncodings();
    public:
        PositionalEncoding(int max_len, int d_model);

        // embeddings [L, d_model] -> embeddings + table[0:L]
        std::shared_ptr<Variable> forward(std::shared_ptr<Variable> embeddings) const;

        int getMaxLen() const { return max_len; }
        int getDModel() const { return d_model; }
        const Tensor& getEncodingTable() const { return encoding_table; }
};

} // namespace tinyformer
