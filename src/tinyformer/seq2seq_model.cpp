#include "tinyformer/seq2seq_model.h"
#include "tinyformer/errors.h"
#include <string>

namespace tinyformer {

namespace {

int validated_source_vocab(int source_vocab_size) {
    if (source_vocab_size <= 0) {
        throw InvalidConfigError("source_vocab_size must be positive, got " +
                                 std::to_string(source_vocab_size));
    }
    return source_vocab_size;
}

}

Seq2SeqModel::Seq2SeqModel(const ModelConfig& config, int source_vocab_size) :
    SequenceModel(config),
    source_vocab_size(validated_source_vocab(source_vocab_size)),
    init_rng(config.seed),
    encoder(source_vocab_size, config.d_model, config.max_len, config.num_heads, init_rng),
    decoder(config.vocab_size, config.d_model, config.max_len, init_rng, true),
    output_head(config.d_model, config.vocab_size, init_rng)
{
    registerModule(encoder);
    registerModule(decoder);
    registerModule(output_head);
}

std::shared_ptr<Variable> Seq2SeqModel::encode(const std::vector<int>& source) const {
    return encoder.forward(source);
}

std::shared_ptr<Variable> Seq2SeqModel::decode(std::shared_ptr<Variable> encoder_output,
                                               const std::vector<int>& target_input) const {
    auto decoded = decoder.forward(target_input, encoder_output, encoder_output);
    return output_head.forward(decoded);
}

std::shared_ptr<Variable> Seq2SeqModel::forward(const std::vector<int>& source,
                                                const std::vector<int>& target_input) const {
    return decode(encode(source), target_input);
}

std::shared_ptr<Variable> Seq2SeqModel::loss(const std::vector<int>& source,
                                             const std::vector<int>& target_input,
                                             const std::vector<int>& labels) const {
    return forward(source, target_input)->log_softmax()->nll_loss(labels);
}

std::shared_ptr<Variable> Seq2SeqModel::loss(const Example& example) const {
    return loss(example.input, example.decoder_input, example.labels);
}

GenerationResult Seq2SeqModel::generate(const std::vector<int>& source, int sos_id, int eos_id) const {
    auto encoder_output = encode(source);

    GreedyDecoder generator(
        [this, encoder_output](const std::vector<int>& running) {
            return decode(encoder_output, running)->getData();
        },
        config.max_len, eos_id);

    return generator.generate({sos_id});
}

} // namespace tinyformer
