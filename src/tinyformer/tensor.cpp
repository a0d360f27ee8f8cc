#include "tinyformer/tensor.h"
#include "tinyformer/blas_wrapper.h"
#include "tinyformer/errors.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <string>

namespace tinyformer {

namespace {

std::string shape_str(size_t rows, size_t cols) {
    return "(" + std::to_string(rows) + "x" + std::to_string(cols) + ")";
}

}

Tensor::Tensor() : data(nullptr), rows(0), cols(0) {}

Tensor::Tensor(size_t rows, size_t cols) {
    if (rows == 0 || cols == 0) {
        throw ShapeError("Tensor dimensions must be positive, got " + shape_str(rows, cols));
    }

    size_t total = rows * cols;

    if (total > MAX_TENSOR_ELEMENTS) {
        throw std::overflow_error("Tensor too large: " + std::to_string(total) +
                                  " elements exceeds maximum of " + std::to_string(MAX_TENSOR_ELEMENTS));
    }

    this->rows = rows;
    this->cols = cols;
    this->data = new float[total];
    blas_vfill(0.0f, data, total);
}

Tensor::Tensor(const Tensor& other) : data(nullptr), rows(other.rows), cols(other.cols) {
    if (other.data == nullptr) {
        return;
    }
    size_t total = rows * cols;
    this->data = new float[total];
    std::copy(other.data, other.data + total, this->data);
}

Tensor::Tensor(Tensor&& other) noexcept :
    data(other.data),
    rows(other.rows),
    cols(other.cols)
{
    other.data = nullptr;
    other.rows = other.cols = 0;
}

Tensor& Tensor::operator=(const Tensor& other) {
    if (this == &other) return *this;
    Tensor tmp(other);

    std::swap(data, tmp.data);
    std::swap(rows, tmp.rows);
    std::swap(cols, tmp.cols);
    return *this;
}

Tensor& Tensor::operator=(Tensor&& other) noexcept {
    if (this == &other) return *this;
    delete[] data;
    data = other.data;
    rows = other.rows;
    cols = other.cols;
    other.data = nullptr;
    other.rows = other.cols = 0;
    return *this;
}

Tensor::~Tensor() {
    delete[] data;
}

float Tensor::getValue(size_t row, size_t col) const {
    if (row >= rows || col >= cols) {
        throw std::out_of_range("Tensor index (" + std::to_string(row) + ", " + std::to_string(col) +
                                ") out of bounds for " + shape_str(rows, cols));
    }
    return data[row * cols + col];
}

void Tensor::setValue(size_t row, size_t col, float value) {
    if (row >= rows || col >= cols) {
        throw std::out_of_range("Tensor index (" + std::to_string(row) + ", " + std::to_string(col) +
                                ") out of bounds for " + shape_str(rows, cols));
    }
    data[row * cols + col] = value;
}

Tensor Tensor::matmul(const Tensor& other) const {
    assertValid("matmul(lhs)");
    other.assertValid("matmul(rhs)");

    if (this->cols != other.rows) {
        throw ShapeError("Matrix dimensions do not match for multiplication: " +
                         shape_str(rows, cols) + " x " + shape_str(other.rows, other.cols));
    }

    const size_t M = this->rows;
    const size_t K = this->cols;
    const size_t N = other.cols;

    Tensor result(M, N);
    blas_sgemm(this->data, other.data, result.data,
               static_cast<int>(M), static_cast<int>(N), static_cast<int>(K));
    return result;
}

Tensor Tensor::add(const Tensor& other) const {
    assertValid("add(lhs)");
    other.assertValid("add(rhs)");

    if (rows == other.rows && cols == other.cols) {
        Tensor result(rows, cols);
        blas_vadd(data, other.data, result.data, numel());
        return result;
    }

    bool rows_compatible = (rows == other.rows) || (rows == 1) || (other.rows == 1);
    bool cols_compatible = (cols == other.cols) || (cols == 1) || (other.cols == 1);
    if (!rows_compatible || !cols_compatible) {
        throw ShapeError("Shapes not broadcastable: " + shape_str(rows, cols) +
                         " + " + shape_str(other.rows, other.cols));
    }

    const size_t R = std::max(rows, other.rows);
    const size_t C = std::max(cols, other.cols);
    Tensor result(R, C);

    const float* A = this->data;
    const float* B = other.data;
    float* Out = result.raw();

    const bool a_row_bcast = (rows == 1);
    const bool a_col_bcast = (cols == 1);
    const bool b_row_bcast = (other.rows == 1);
    const bool b_col_bcast = (other.cols == 1);

    for (size_t i = 0; i < R; ++i) {
        const size_t ai = a_row_bcast ? 0 : i;
        const size_t bi = b_row_bcast ? 0 : i;
        const size_t a_row_off = ai * cols;
        const size_t b_row_off = bi * other.cols;
        const size_t out_row_off = i * C;

        for (size_t j = 0; j < C; ++j) {
            const size_t aj = a_col_bcast ? 0 : j;
            const size_t bj = b_col_bcast ? 0 : j;
            Out[out_row_off + j] = A[a_row_off + aj] + B[b_row_off + bj];
        }
    }
    return result;
}

void Tensor::add_inplace(const Tensor& other) {
    assertValid("add_inplace(lhs)");
    other.assertValid("add_inplace(rhs)");
    if (rows != other.rows || cols != other.cols) {
        throw ShapeError("add_inplace shape mismatch: " + shape_str(rows, cols) +
                         " += " + shape_str(other.rows, other.cols));
    }
    blas_vadd(data, other.data, data, numel());
}

Tensor Tensor::elementwise(const Tensor& other) const {
    assertValid("elementwise(lhs)");
    other.assertValid("elementwise(rhs)");

    if (this->rows != other.rows || this->cols != other.cols) {
        throw ShapeError("Matrix dimensions do not match for elementwise multiply");
    }
    Tensor result(this->rows, this->cols);
    blas_vmul(data, other.data, result.data, numel());
    return result;
}

Tensor Tensor::transpose() const {
    assertValid("transpose(this)");

    Tensor result(this->cols, this->rows);
    const float* src = this->raw();
    float* dst = result.raw();

    for (size_t i = 0; i < this->rows; ++i) {
        for (size_t j = 0; j < this->cols; ++j) {
            dst[j * this->rows + i] = src[i * this->cols + j];
        }
    }
    return result;
}

// Row-wise, numerically stable (max subtracted before exp).
Tensor Tensor::softmax() const {
    assertValid("softmax(this)");

    Tensor result(this->rows, this->cols);
    const float* input_data = this->raw();
    float* output_data = result.raw();

    for (size_t i = 0; i < this->rows; i++) {
        const float* row_in = input_data + i * this->cols;
        float* row_out = output_data + i * this->cols;

        float max_val = row_in[0];
        for (size_t j = 1; j < this->cols; j++) {
            if (row_in[j] > max_val) max_val = row_in[j];
        }

        float sum = 0.0f;
        for (size_t j = 0; j < this->cols; j++) {
            const float val = std::exp(row_in[j] - max_val);
            row_out[j] = val;
            sum += val;
        }

        const float inv_sum = 1.0f / sum;
        for (size_t j = 0; j < this->cols; j++) {
            row_out[j] *= inv_sum;
        }
    }
    return result;
}

void Tensor::fill(float value) {
    assertValid("fill(this)");
    blas_vfill(value, data, numel());
}

Tensor Tensor::scale(float scaler) const {
    assertValid("scale(this)");
    Tensor result(this->rows, this->cols);
    blas_vsmul(data, scaler, result.data, numel());
    return result;
}

Tensor Tensor::slice(size_t start_row, size_t num_rows, size_t start_col, size_t num_cols) const {
    assertValid("slice(this)");
    if (start_row + num_rows > this->rows || start_col + num_cols > this->cols) {
        throw ShapeError("slice [" + std::to_string(start_row) + "+" + std::to_string(num_rows) + ", " +
                         std::to_string(start_col) + "+" + std::to_string(num_cols) + "] out of bounds for " +
                         shape_str(rows, cols));
    }

    Tensor result(num_rows, num_cols);
    for (size_t i = 0; i < num_rows; i++) {
        const float* src = data + (start_row + i) * cols + start_col;
        std::copy(src, src + num_cols, result.data + i * num_cols);
    }
    return result;
}

Tensor Tensor::concatenate_cols(const Tensor& other) const {
    assertValid("concatenate_cols(lhs)");
    other.assertValid("concatenate_cols(rhs)");

    if (this->rows != other.rows) {
        throw ShapeError("Rows do not match for column concatenation: " +
                         shape_str(rows, cols) + " | " + shape_str(other.rows, other.cols));
    }

    Tensor result(this->rows, this->cols + other.cols);
    for (size_t i = 0; i < this->rows; i++) {
        float* out_row = result.data + i * result.cols;
        std::copy(this->data + i * this->cols, this->data + (i + 1) * this->cols, out_row);
        std::copy(other.data + i * other.cols, other.data + (i + 1) * other.cols, out_row + this->cols);
    }
    return result;
}

void Tensor::xavier(size_t fan_in, size_t fan_out, std::mt19937& gen) {
    assertValid("xavier(target)");

    float limit = std::sqrt(6.0f / (fan_in + fan_out));
    std::uniform_real_distribution<float> dis(-limit, limit);

    for (size_t i = 0; i < numel(); i++) {
        data[i] = dis(gen);
    }
}

void Tensor::assertValid(const std::string& context) const {
    if (data == nullptr) {
        throw std::runtime_error("Tensor error [" + context + "]: data pointer is null");
    }
    if (rows == 0 || cols == 0) {
        throw std::runtime_error("Tensor error [" + context + "]: invalid shape " + shape_str(rows, cols));
    }
}

} // namespace tinyformer
