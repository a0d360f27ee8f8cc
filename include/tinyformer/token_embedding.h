#pragma once
#include "module.h"
#include "tensor.h"
#include "variable.h"
#include <memory>
#include <random>
#include <vector>

namespace tinyformer {

class TokenEmbedding : public Module {
    private:
        int vocab_size;
        int d_model;
        std::shared_ptr<Variable> embedding_table;
    public:
        TokenEmbedding(int vocab_size, int d_model, std::mt19937& gen);

        // token ids [L] -> rows of the embedding table [L, d_model]
        std::shared_ptr<Variable> forward(const std::vector<int>& token_ids) const;

        int getVocabSize() const { return vocab_size; }
        int getDModel() const { return d_model; }

        std::shared_ptr<Variable> getEmbeddingTable() const { return embedding_table; }
};

} // namespace tinyformer
