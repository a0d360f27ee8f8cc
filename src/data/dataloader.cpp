#include "data/dataloader.h"
#include <algorithm>
#include <stdexcept>

namespace tinyformer {

DataLoader::DataLoader(const Dataset& dataset, bool shuffle, unsigned int seed)
    : dataset_(dataset),
      shuffle_(shuffle),
      current_index_(0),
      rng_(seed) {

    if (dataset_.size() == 0) {
        throw std::invalid_argument("DataLoader needs a non-empty dataset");
    }

    indices_.resize(dataset_.size());
    for (size_t i = 0; i < dataset_.size(); i++) {
        indices_[i] = i;
    }

    if (shuffle_) {
        std::shuffle(indices_.begin(), indices_.end(), rng_);
    }
}

bool DataLoader::has_next() const {
    return current_index_ < indices_.size();
}

const Example& DataLoader::next() {
    if (!has_next()) {
        throw std::runtime_error("No more examples available. Call reset() to start new epoch.");
    }
    return dataset_.get_item(indices_[current_index_++]);
}

void DataLoader::reset() {
    current_index_ = 0;
    if (shuffle_) {
        std::shuffle(indices_.begin(), indices_.end(), rng_);
    }
}

} // namespace tinyformer
