#include "data/dataset.h"
#include <stdexcept>
#include <string>
#include <utility>

namespace tinyformer {

ExampleDataset::ExampleDataset(std::vector<Example> examples) {
    for (auto& example : examples) {
        add(std::move(example));
    }
}

void ExampleDataset::add(Example example) {
    if (example.input.empty()) {
        throw std::invalid_argument("Example input must not be empty");
    }
    examples_.push_back(std::move(example));
}

size_t ExampleDataset::size() const {
    return examples_.size();
}

const Example& ExampleDataset::get_item(size_t index) const {
    if (index >= size()) {
        throw std::out_of_range("Dataset index " + std::to_string(index) +
                                " out of range (size " + std::to_string(size()) + ")");
    }
    return examples_[index];
}

} // namespace tinyformer
