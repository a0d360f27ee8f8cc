#include "tinyformer/positional_encoding.h"
#include "tinyformer/errors.h"
#include <cmath>
#include <string>

namespace tinyformer {

namespace {

int validated_max_len(int max_len, int d_model) {
    if (d_model < 2 || d_model % 2 != 0) {
        throw InvalidConfigError("d_model must be even and >= 2, got " + std::to_string(d_model));
    }
    if (max_len < 1) {
        throw InvalidConfigError("max_len must be >= 1, got " + std::to_string(max_len));
    }
    return max_len;
}

}

PositionalEncoding::PositionalEncoding(int max_len, int d_model) :
    max_len(validated_max_len(max_len, d_model)),
    d_model(d_model),
    encoding_table(max_len, d_model)
{
    computeEncodings();
}

void PositionalEncoding::computeEncodings() {
    for (int i = 0; i < max_len; i++) {
        for (int j = 0; j < d_model; j++) {
            double angle = i / std::pow(10000.0, (2.0 * (j / 2)) / d_model);

            if (j % 2 == 0) {
                encoding_table.setValue(i, j, static_cast<float>(std::sin(angle)));
            } else {
                encoding_table.setValue(i, j, static_cast<float>(std::cos(angle)));
            }
        }
    }
}

std::shared_ptr<Variable> PositionalEncoding::forward(std::shared_ptr<Variable> embeddings) const {
    const Tensor& emb_tensor = embeddings->getData();
    int seq_len = emb_tensor.getRows();

    if (seq_len > max_len) {
        throw ShapeError("Sequence length " + std::to_string(seq_len) +
                         " exceeds max_len " + std::to_string(max_len));
    }

    if (static_cast<int>(emb_tensor.getCols()) != d_model) {
        throw ShapeError("Embedding width " + std::to_string(emb_tensor.getCols()) +
                         " does not match d_model " + std::to_string(d_model));
    }

    auto positions = Variable::create(encoding_table.slice(0, seq_len, 0, d_model), false);
    return embeddings->add(positions);
}

} // namespace tinyformer
