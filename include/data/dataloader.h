#pragma once
#include "dataset.h"
#include <cstddef>
#include <random>
#include <vector>

namespace tinyformer {

// Walks a dataset one example at a time, optionally in a seeded shuffled
// order that is redrawn on every reset().
class DataLoader {
private:
    const Dataset& dataset_;
    bool shuffle_;
    std::vector<size_t> indices_;
    size_t current_index_;
    std::mt19937 rng_;

public:
    DataLoader(const Dataset& dataset, bool shuffle = true, unsigned int seed = 42);

    bool has_next() const;
    const Example& next();
    void reset();

    size_t dataset_size() const {
        return dataset_.size();
    }
};

} // namespace tinyformer
