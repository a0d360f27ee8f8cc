#include "tinyformer/greedy_decoder.h"
#include "tinyformer/errors.h"
#include <string>
#include <utility>

namespace tinyformer {

int argmax_row(const Tensor& logits, size_t row) {
    int best = 0;
    float max_score = logits.getValue(row, 0);
    for (size_t j = 1; j < logits.getCols(); j++) {
        if (logits.getValue(row, j) > max_score) {
            max_score = logits.getValue(row, j);
            best = static_cast<int>(j);
        }
    }
    return best;
}

GreedyDecoder::GreedyDecoder(StepFn step, int max_len, int eos_id) :
    step(std::move(step)),
    max_len(max_len),
    eos_id(eos_id),
    state(DecodeState::Done)
{
    if (max_len < 1) {
        throw InvalidConfigError("max_len must be >= 1, got " + std::to_string(max_len));
    }
}

int GreedyDecoder::next_token() {
    Tensor logits = step(running);
    if (logits.getRows() != running.size()) {
        throw ShapeError("Step produced " + std::to_string(logits.getRows()) +
                         " logit rows for " + std::to_string(running.size()) + " tokens");
    }
    return argmax_row(logits, logits.getRows() - 1);
}

GenerationResult GreedyDecoder::generate(const std::vector<int>& prompt) {
    if (prompt.empty()) {
        throw ShapeError("Generation prompt must not be empty");
    }
    if (static_cast<int>(prompt.size()) > max_len) {
        throw ShapeError("Prompt length " + std::to_string(prompt.size()) +
                         " exceeds max_len " + std::to_string(max_len));
    }

    GenerationResult result;
    running = prompt;
    state = DecodeState::Prompted;

    if (static_cast<int>(running.size()) >= max_len) {
        state = DecodeState::Done;
        return result;
    }

    while (state != DecodeState::Done) {
        int token = next_token();
        running.push_back(token);
        result.tokens.push_back(token);

        if (token == eos_id) {
            result.reached_eos = true;
            state = DecodeState::Done;
        } else if (static_cast<int>(running.size()) >= max_len) {
            state = DecodeState::Done;
        } else {
            state = DecodeState::Generating;
        }
    }
    return result;
}

} // namespace tinyformer
