#pragma once

#include "tensor.h"
#include <functional>
#include <vector>

namespace tinyformer {

enum class DecodeState {
    Prompted,
    Generating,
    Done
};

struct GenerationResult {
    std::vector<int> tokens;    // generated tokens only, in order
    bool reached_eos = false;
};

// Index of the largest value in the given row; ties go to the lowest index.
int argmax_row(const Tensor& logits, size_t row);

// Greedy token-by-token generation over a step function that maps the running
// sequence to logits [len(running), vocab]. Each step takes the argmax of the
// last row. Stops on eos_id or when the running sequence reaches max_len, so
// the running length never exceeds max_len.
class GreedyDecoder {
    public:
        using StepFn = std::function<Tensor(const std::vector<int>& running)>;

        GreedyDecoder(StepFn step, int max_len, int eos_id);

        GenerationResult generate(const std::vector<int>& prompt);

        DecodeState getState() const { return state; }
        const std::vector<int>& getRunning() const { return running; }
    private:
        StepFn step;
        int max_len;
        int eos_id;
        DecodeState state;
        std::vector<int> running;

        int next_token();
};

} // namespace tinyformer
