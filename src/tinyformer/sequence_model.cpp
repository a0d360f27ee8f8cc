#include "tinyformer/sequence_model.h"

namespace tinyformer {

SequenceModel::SequenceModel(const ModelConfig& config) : config(config) {
    this->config.validate();
}

} // namespace tinyformer
