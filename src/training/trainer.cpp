#include "training/trainer.h"
#include "tinyformer/errors.h"
#include "utils/training_utils.h"
#include <iostream>
#include <sstream>

namespace training {

void TrainingConfig::validate() const {
    using tinyformer::InvalidConfigError;
    if (!(learning_rate > 0.0f)) {
        throw InvalidConfigError("learning_rate must be positive, got " + std::to_string(learning_rate));
    }
    if (num_epochs < 1) {
        throw InvalidConfigError("num_epochs must be >= 1, got " + std::to_string(num_epochs));
    }
    if (log_interval < 1) {
        throw InvalidConfigError("log_interval must be >= 1, got " + std::to_string(log_interval));
    }
    if (!(max_grad_norm > 0.0f)) {
        throw InvalidConfigError("max_grad_norm must be positive, got " + std::to_string(max_grad_norm));
    }
    if (warmup_steps < 0) {
        throw InvalidConfigError("warmup_steps must be non-negative, got " + std::to_string(warmup_steps));
    }
}

std::string TrainingConfig::describe() const {
    std::ostringstream out;
    out << "lr=" << learning_rate
        << " epochs=" << num_epochs
        << " clip=" << max_grad_norm
        << " betas=(" << beta1 << ", " << beta2 << ")"
        << " shuffle=" << (shuffle ? "on" : "off")
        << " seed=" << seed;
    return out.str();
}

Trainer::Trainer(const TrainingConfig& config,
                 tinyformer::SequenceModel& model,
                 const tinyformer::Dataset& dataset)
    : config_(config), model_(model), loader_(dataset, config.shuffle, config.seed) {

    config_.validate();

    optimizer_ = std::make_unique<tinyformer::AdamOptimizer>(model_.getParameters(), config_.learning_rate,
                                                              config_.beta1, config_.beta2,
                                                              config_.epsilon, config_.weight_decay);
    optimizer_->set_warmup_steps(config_.warmup_steps);

    metrics_ = std::make_unique<utils::TrainingMetrics>(config_.num_epochs, config_.verbose);
}

float Trainer::train() {
    if (config_.verbose) {
        utils::print_header("Training Started");

        std::cout << "Config:" << std::endl;
        std::cout << "  Model: " << model_.getConfig().describe() << std::endl;
        std::cout << "  Parameters: " << utils::count_parameters(model_.getParameters()) << std::endl;
        std::cout << "  Examples: " << loader_.dataset_size() << std::endl;
        std::cout << "  Optimizer: " << config_.describe() << "\n" << std::endl;
    }

    metrics_->print_table_header();
    metrics_->start_training();

    float last_loss = 0.0f;
    for (int epoch = 0; epoch < config_.num_epochs; epoch++) {
        last_loss = train_epoch();

        const float grad_norm = utils::compute_grad_norm(model_.getParameters());
        metrics_->record_epoch(last_loss, grad_norm);

        if (epoch % config_.log_interval == 0 || epoch + 1 == config_.num_epochs) {
            metrics_->print_progress(epoch, last_loss, grad_norm);
        }
    }

    metrics_->print_summary();
    return last_loss;
}

float Trainer::train_epoch() {
    loader_.reset();

    float total = 0.0f;
    size_t count = 0;
    while (loader_.has_next()) {
        total += training_step(loader_.next());
        count++;
    }
    return total / static_cast<float>(count);
}

float Trainer::training_step(const tinyformer::Example& example) {
    optimizer_->zero_grad();

    auto loss = model_.loss(example);
    const float loss_val = loss->getData().getValue(0, 0);

    loss->backward();
    loss->release_graph();

    optimizer_->clip_grad_norm(config_.max_grad_norm);
    optimizer_->step();

    return loss_val;
}

} // namespace training
