#include "tinyformer/token_embedding.h"
#include "tinyformer/errors.h"
#include <string>

namespace tinyformer {

TokenEmbedding::TokenEmbedding(int vocab_size, int d_model, std::mt19937& gen) :
    vocab_size(vocab_size),
    d_model(d_model)
{
    if (vocab_size <= 0) {
        throw InvalidConfigError("vocab_size must be positive, got " + std::to_string(vocab_size));
    }
    if (d_model <= 0) {
        throw InvalidConfigError("d_model must be positive, got " + std::to_string(d_model));
    }

    Tensor embedding_tensor(vocab_size, d_model);
    embedding_tensor.xavier(vocab_size, d_model, gen);

    embedding_table = Variable::create(embedding_tensor, true);
    registerParameter(embedding_table);
}

std::shared_ptr<Variable> TokenEmbedding::forward(const std::vector<int>& token_ids) const {
    if (token_ids.empty()) {
        throw ShapeError("TokenEmbedding: empty token sequence");
    }

    const int seq_len = static_cast<int>(token_ids.size());
    const Tensor& table = embedding_table->getData();
    Tensor result(seq_len, d_model);

    for (int i = 0; i < seq_len; i++) {
        int token_id = token_ids[i];
        if (token_id < 0 || token_id >= vocab_size) {
            throw VocabularyError("Token ID " + std::to_string(token_id) +
                                  " out of vocabulary range [0, " + std::to_string(vocab_size) + ")");
        }

        for (int j = 0; j < d_model; j++) {
            result.setValue(i, j, table.getValue(token_id, j));
        }
    }

    auto output = Variable::create(result, embedding_table->requiresGrad());

    if (embedding_table->requiresGrad()) {
        auto self_embedding = embedding_table;
        int self_vocab_size = vocab_size;
        int self_d_model = d_model;

        output->addChild(embedding_table);
        output->setBackwardFn([self_embedding, token_ids, self_vocab_size, self_d_model,
                               output_weak = std::weak_ptr<Variable>(output)]() {
            auto output = output_weak.lock();
            if (!output) return;
            Tensor dEmbedding(self_vocab_size, self_d_model);

            for (size_t i = 0; i < token_ids.size(); i++) {
                int token_id = token_ids[i];
                for (int j = 0; j < self_d_model; j++) {
                    dEmbedding.setValue(token_id, j,
                        dEmbedding.getValue(token_id, j) + output->getGrad().getValue(i, j));
                }
            }

            self_embedding->getGrad().add_inplace(dEmbedding);
        });
    }
    return output;
}

} // namespace tinyformer
