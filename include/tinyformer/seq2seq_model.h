#pragma once
#include "sequence_model.h"
#include "encoder_block.h"
#include "decoder_block.h"
#include "greedy_decoder.h"
#include "linear.h"
#include <memory>
#include <random>
#include <vector>

namespace tinyformer {

// Encoder-decoder translator. config.vocab_size is the target vocabulary;
// the encoder embeds source_vocab_size tokens.
class Seq2SeqModel : public SequenceModel {
    private:
        int source_vocab_size;
        std::mt19937 init_rng;
        EncoderBlock encoder;
        DecoderBlock decoder;
        Linear output_head;
    public:
        Seq2SeqModel(const ModelConfig& config, int source_vocab_size);

        std::shared_ptr<Variable> encode(const std::vector<int>& source) const;

        // Logits [len(target_input), vocab_size] against a fixed encoder output.
        std::shared_ptr<Variable> decode(std::shared_ptr<Variable> encoder_output,
                                         const std::vector<int>& target_input) const;

        std::shared_ptr<Variable> forward(const std::vector<int>& source,
                                          const std::vector<int>& target_input) const;

        std::shared_ptr<Variable> loss(const std::vector<int>& source,
                                       const std::vector<int>& target_input,
                                       const std::vector<int>& labels) const;
        std::shared_ptr<Variable> loss(const Example& example) const override;

        // Greedy translation starting from sos_id; the encoder runs once.
        GenerationResult generate(const std::vector<int>& source, int sos_id, int eos_id) const;

        int getSourceVocabSize() const { return source_vocab_size; }
        const EncoderBlock& getEncoder() const { return encoder; }
        const DecoderBlock& getDecoder() const { return decoder; }
};

} // namespace tinyformer
