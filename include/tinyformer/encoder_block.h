#pragma once
#include "module.h"
#include "token_embedding.h"
#include "positional_encoding.h"
#include "multihead_attention.h"
#include <memory>
#include <random>
#include <vector>

namespace tinyformer {

// embed -> + positional encoding -> unmasked self-attention -> residual add
class EncoderBlock : public Module {
    private:
        TokenEmbedding token_embedding;
        PositionalEncoding pos_encoding;
        MultiHeadAttention self_attention;
    public:
        EncoderBlock(int vocab_size, int d_model, int max_len, int num_heads, std::mt19937& gen);

        // Token embeddings plus positional signal, [L, d_model].
        std::shared_ptr<Variable> embed(const std::vector<int>& tokens) const;

        std::shared_ptr<Variable> forward(const std::vector<int>& tokens) const;

        const TokenEmbedding& getTokenEmbedding() const { return token_embedding; }
        const PositionalEncoding& getPositionalEncoding() const { return pos_encoding; }
        const MultiHeadAttention& getSelfAttention() const { return self_attention; }
};

} // namespace tinyformer
