#pragma once

#include "tinyformer/sequence_model.h"
#include "tinyformer/optimizer.h"
#include "data/dataset.h"
#include "data/dataloader.h"
#include "utils/metrics.h"
#include <string>
#include <memory>

namespace training {

struct TrainingConfig {
    float learning_rate = 0.01f;
    int num_epochs = 100;
    int log_interval = 10;
    float max_grad_norm = 5.0f;
    float beta1 = 0.9f;
    float beta2 = 0.999f;
    float epsilon = 1e-8f;
    float weight_decay = 0.0f;
    int warmup_steps = 0;
    bool shuffle = true;
    unsigned int seed = 42;
    bool verbose = true;

    // Throws tinyformer::InvalidConfigError.
    void validate() const;
    std::string describe() const;
};

// Next-token training of any SequenceModel on a fixed dataset, one
// example per optimizer step.
class Trainer {
public:
    Trainer(const TrainingConfig& config,
            tinyformer::SequenceModel& model,
            const tinyformer::Dataset& dataset);

    // Runs num_epochs epochs; returns the mean loss of the last one.
    float train();
    // One pass over the dataset; returns the mean example loss.
    float train_epoch();

    const utils::TrainingMetrics& getMetrics() const { return *metrics_; }

private:
    TrainingConfig config_;
    tinyformer::SequenceModel& model_;
    tinyformer::DataLoader loader_;
    std::unique_ptr<tinyformer::AdamOptimizer> optimizer_;
    std::unique_ptr<utils::TrainingMetrics> metrics_;

    float training_step(const tinyformer::Example& example);
};

} // namespace training
