#include "tinyformer/decoder_only_model.h"

namespace tinyformer {

DecoderOnlyModel::DecoderOnlyModel(const ModelConfig& config) :
    SequenceModel(config),
    init_rng(config.seed),
    decoder(config.vocab_size, config.d_model, config.max_len, init_rng, false),
    output_head(config.d_model, config.vocab_size, init_rng)
{
    registerModule(decoder);
    registerModule(output_head);
}

std::shared_ptr<Variable> DecoderOnlyModel::forward(const std::vector<int>& tokens) const {
    return output_head.forward(decoder.forward(tokens));
}

std::shared_ptr<Variable> DecoderOnlyModel::loss(const std::vector<int>& tokens, const std::vector<int>& labels) const {
    return forward(tokens)->log_softmax()->nll_loss(labels);
}

std::shared_ptr<Variable> DecoderOnlyModel::loss(const Example& example) const {
    return loss(example.input, example.labels);
}

GenerationResult DecoderOnlyModel::generate(const std::vector<int>& prompt, int eos_id) const {
    GreedyDecoder generator(
        [this](const std::vector<int>& running) {
            return forward(running)->getData();
        },
        config.max_len, eos_id);

    return generator.generate(prompt);
}

} // namespace tinyformer
