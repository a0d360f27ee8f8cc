#pragma once
#include <cstddef>
#include <random>
#include <string>

namespace tinyformer {

// Dense row-major 2D float matrix. Owns its buffer.
class Tensor {
    private:
        float* data;
        size_t rows;
        size_t cols;

    public:
        static constexpr size_t MAX_TENSOR_ELEMENTS = 1ULL << 28;

        Tensor();
        Tensor(size_t rows, size_t cols);
        Tensor(const Tensor& other);
        Tensor(Tensor&& other) noexcept;
        Tensor& operator=(const Tensor& other);
        Tensor& operator=(Tensor&& other) noexcept;
        ~Tensor();

        float getValue(size_t row, size_t col) const;
        void setValue(size_t row, size_t col, float value);

        float* raw() { return data; }
        const float* raw() const { return data; }

        size_t getRows() const { return rows; }
        size_t getCols() const { return cols; }
        size_t numel() const { return rows * cols; }
        bool empty() const { return data == nullptr; }

        Tensor matmul(const Tensor& other) const;
        Tensor add(const Tensor& other) const;
        void add_inplace(const Tensor& other);
        Tensor elementwise(const Tensor& other) const;

        Tensor transpose() const;
        Tensor softmax() const;
        void fill(float value);
        Tensor scale(float scaler) const;

        Tensor slice(size_t start_row, size_t num_rows, size_t start_col, size_t num_cols) const;
        Tensor concatenate_cols(const Tensor& other) const;

        void xavier(size_t fan_in, size_t fan_out, std::mt19937& gen);

        void assertValid(const std::string& context) const;
};

} // namespace tinyformer
