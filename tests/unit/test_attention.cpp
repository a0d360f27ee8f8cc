#include "tinyformer/attention.h"
#include "tinyformer/multihead_attention.h"
#include "tinyformer/attention_mask.h"
#include "tinyformer/errors.h"
#include "utils/training_utils.h"
#include "../test_utils.h"
#include <iostream>
#include <cmath>
#include <random>

using namespace tinyformer;

namespace {

std::shared_ptr<Variable> random_input(size_t rows, size_t cols, std::mt19937& gen) {
    Tensor t(rows, cols);
    std::uniform_real_distribution<float> dis(-1.0f, 1.0f);
    for (size_t i = 0; i < t.numel(); i++) t.raw()[i] = dis(gen);
    return Variable::create(t, false);
}

bool same_values(const Tensor& a, const Tensor& b) {
    if (a.getRows() != b.getRows() || a.getCols() != b.getCols()) return false;
    for (size_t i = 0; i < a.numel(); i++) {
        if (a.raw()[i] != b.raw()[i]) return false;
    }
    return true;
}

}

void test_causal_mask() {
    test::section("Test 1: Causal Mask");

    AttentionMask mask = AttentionMask::causal(4);
    bool pattern = true;
    for (size_t i = 0; i < 4; i++) {
        for (size_t j = 0; j < 4; j++) {
            pattern = pattern && (mask.isSuppressed(i, j) == (j > i));
        }
    }
    test::expect_true(pattern, "(i, j) suppressed exactly when j > i");

    AttentionMask open(2, 3);
    test::expect_true(!open.isSuppressed(1, 2), "a fresh mask suppresses nothing");
    test::expect_throws<ShapeError>([]() { AttentionMask bad(0, 2); }, "empty mask rejected");
}

void test_weights_are_distributions() {
    test::section("Test 2: Attention Weights");
    std::mt19937 gen(11);

    AttentionHead head(4, gen);
    auto x = random_input(5, 4, gen);
    auto y = random_input(3, 4, gen);

    auto weights = head.attention_weights(x, y)->getData();
    test::expect_true(weights.getRows() == 5 && weights.getCols() == 3, "weights are [len(q), len(k)]");

    bool non_negative = true;
    bool rows_sum_to_one = true;
    for (size_t i = 0; i < weights.getRows(); i++) {
        float sum = 0.0f;
        for (size_t j = 0; j < weights.getCols(); j++) {
            non_negative = non_negative && weights.getValue(i, j) >= 0.0f;
            sum += weights.getValue(i, j);
        }
        rows_sum_to_one = rows_sum_to_one && std::abs(sum - 1.0f) < 1e-5f;
    }
    test::expect_true(non_negative, "weights are non-negative");
    test::expect_true(rows_sum_to_one, "each row sums to 1");

    auto out = head.compute(x, y, y);
    test::expect_true(out->getData().getRows() == 5 && out->getData().getCols() == 4, "output is [len(q), d_model]");
}

void test_masking() {
    test::section("Test 3: Masked Attention");
    std::mt19937 gen(12);

    AttentionHead head(4, gen);
    auto x = random_input(4, 4, gen);

    AttentionMask causal = AttentionMask::causal(4);
    auto causal_weights = head.attention_weights(x, x, &causal)->getData();
    test::expect_near(causal_weights.getValue(0, 0), 1.0f, 1e-6f, "first query attends only to itself");
    test::expect_near(causal_weights.getValue(1, 3), 0.0f, 1e-6f, "future positions get zero weight");

    AttentionMask diagonal_only(4, 4);
    for (size_t i = 0; i < 4; i++) {
        for (size_t j = 0; j < 4; j++) {
            if (i != j) diagonal_only.set(i, j, true);
        }
    }
    auto diag_weights = head.attention_weights(x, x, &diagonal_only)->getData();
    bool on_diagonal = true;
    for (size_t i = 0; i < 4; i++) {
        on_diagonal = on_diagonal && std::abs(diag_weights.getValue(i, i) - 1.0f) < 1e-5f;
    }
    test::expect_true(on_diagonal, "suppressing everything but the diagonal puts all weight there");

    // Masked output row i equals the unmasked output over the prefix 0..i.
    auto full = head.compute(x, x, x, &causal)->getData();
    Tensor prefix_data = x->getData().slice(0, 2, 0, 4);
    auto prefix = Variable::create(prefix_data, false);
    auto partial = head.compute(prefix, prefix, prefix)->getData();
    bool prefix_match = true;
    for (size_t j = 0; j < 4; j++) {
        prefix_match = prefix_match && std::abs(full.getValue(1, j) - partial.getValue(1, j)) < 1e-5f;
    }
    test::expect_true(prefix_match, "causal output ignores later positions");

    AttentionMask wrong(4, 3);
    test::expect_throws<ShapeError>([&]() { head.attention_weights(x, x, &wrong); }, "mask shape mismatch throws ShapeError");
    test::expect_throws<ShapeError>([&]() { head.compute(x, random_input(4, 2, gen), x); }, "key width mismatch throws ShapeError");
    test::expect_throws<ShapeError>([&]() { head.compute(x, x, random_input(3, 4, gen)); }, "key/value length mismatch throws ShapeError");
}

void test_determinism() {
    test::section("Test 4: Determinism");
    std::mt19937 gen_a(5), gen_b(5), gen_in(6);

    AttentionHead head_a(4, gen_a);
    AttentionHead head_b(4, gen_b);
    auto x = random_input(3, 4, gen_in);

    auto first = head_a.compute(x, x, x)->getData();
    auto second = head_a.compute(x, x, x)->getData();
    test::expect_true(same_values(first, second), "repeated forward passes are identical");
    test::expect_true(same_values(first, head_b.compute(x, x, x)->getData()), "same seed gives the same head");
    test::expect_true(head_a.getParameters().size() == 3, "three bias-free projections");
}

void test_multihead() {
    test::section("Test 5: Multi-Head Attention");
    std::mt19937 gen(21), gen_in(22);

    MultiHeadAttention single(4, 1, gen);
    auto x = random_input(3, 4, gen_in);
    test::expect_true(single.getUnifyHeads() == nullptr, "one head has no output projection");
    test::expect_true(same_values(single.compute(x, x, x)->getData(),
                                  single.getHead(0).compute(x, x, x)->getData()),
                      "one head returns the head output directly");

    MultiHeadAttention triple(4, 3, gen);
    auto out = triple.compute(x, x, x);
    test::expect_true(out->getData().getRows() == 3 && out->getData().getCols() == 4, "three heads project back to d_model");

    const size_t expected_params = 3 * 3 * 4 * 4 + (3 * 4 * 4 + 4);
    test::expect_true(utils::count_parameters(triple.getParameters()) == expected_params,
                      "parameters: 3 heads x 3 projections + unify Linear");

    test::expect_throws<InvalidConfigError>([&]() { MultiHeadAttention bad(4, 0, gen); }, "zero heads rejected");
}

int main() {
    std::cout << "=== Attention Test Suite ===" << std::endl;

    try {
        test_causal_mask();
        test_weights_are_distributions();
        test_masking();
        test_determinism();
        test_multihead();
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return test::finish("Attention");
}
