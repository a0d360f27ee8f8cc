#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace utils {

// Per-epoch loss history plus the console table the trainer prints.
class TrainingMetrics {
public:
    explicit TrainingMetrics(int total_epochs, bool verbose = true);

    void start_training();
    void record_epoch(float mean_loss, float grad_norm);
    void print_table_header() const;
    void print_progress(int epoch, float loss, float grad_norm) const;
    void print_summary() const;

    const std::vector<float>& loss_history() const { return losses_; }
    const std::vector<float>& grad_norm_history() const { return grad_norms_; }
    float best_loss() const;

private:
    int total_epochs_;
    bool verbose_;
    std::chrono::high_resolution_clock::time_point start_time_;
    std::vector<float> losses_;
    std::vector<float> grad_norms_;
};

void print_header(const std::string& title);
void print_section(const std::string& title);

} // namespace utils
