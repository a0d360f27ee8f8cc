#pragma once
#include "module.h"
#include "token_embedding.h"
#include "positional_encoding.h"
#include "attention.h"
#include <memory>
#include <random>
#include <vector>

namespace tinyformer {

// embed -> + positional encoding -> causal self-attention -> residual
//       [-> cross-attention over encoder output -> residual]
//
// The cross-attention residual is added onto the self-attention residual,
// so both additions compound.
class DecoderBlock : public Module {
    private:
        TokenEmbedding token_embedding;
        PositionalEncoding pos_encoding;
        AttentionHead self_attention;
        std::unique_ptr<AttentionHead> cross_attention;

        std::shared_ptr<Variable> masked_self_attention(const std::vector<int>& tokens) const;
    public:
        DecoderBlock(int vocab_size, int d_model, int max_len, std::mt19937& gen, bool with_cross_attention);

        std::shared_ptr<Variable> embed(const std::vector<int>& tokens) const;

        // Decoder-only: requires a block built without cross-attention.
        std::shared_ptr<Variable> forward(const std::vector<int>& tokens) const;

        // Encoder-decoder: queries from the decoder, keys/values from the encoder, no mask.
        std::shared_ptr<Variable> forward(const std::vector<int>& tokens,
                                          std::shared_ptr<Variable> encoder_keys,
                                          std::shared_ptr<Variable> encoder_values) const;

        bool hasCrossAttention() const { return cross_attention != nullptr; }
        const TokenEmbedding& getTokenEmbedding() const { return token_embedding; }
        const PositionalEncoding& getPositionalEncoding() const { return pos_encoding; }
        const AttentionHead& getSelfAttention() const { return self_attention; }
        const AttentionHead* getCrossAttention() const { return cross_attention.get(); }
};

} // namespace tinyformer
