#pragma once
#include <vector>
#include <string>
#include <cstddef>

namespace tinyformer {

// One shifted-target training example. decoder_input is only used by the
// encoder-decoder model and stays empty elsewhere.
struct Example {
    std::vector<int> input;
    std::vector<int> decoder_input;
    std::vector<int> labels;
};

class Dataset {
    public:
        virtual ~Dataset() = default;
        virtual size_t size() const = 0;
        virtual const Example& get_item(size_t index) const = 0;
};

class ExampleDataset : public Dataset {
    private:
        std::vector<Example> examples_;
    public:
        ExampleDataset() = default;
        explicit ExampleDataset(std::vector<Example> examples);

        void add(Example example);

        size_t size() const override;
        const Example& get_item(size_t index) const override;
};

} // namespace tinyformer
