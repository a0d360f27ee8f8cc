#include "utils/metrics.h"
#include "utils/training_utils.h"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace utils {

TrainingMetrics::TrainingMetrics(int total_epochs, bool verbose)
    : total_epochs_(total_epochs), verbose_(verbose) {
    losses_.reserve(total_epochs_ > 0 ? total_epochs_ : 0);
}

void TrainingMetrics::start_training() {
    start_time_ = std::chrono::high_resolution_clock::now();
    losses_.clear();
    grad_norms_.clear();
}

void TrainingMetrics::record_epoch(float mean_loss, float grad_norm) {
    losses_.push_back(mean_loss);
    grad_norms_.push_back(grad_norm);
}

void TrainingMetrics::print_table_header() const {
    if (!verbose_) return;
    std::cout << std::setw(10) << "Epoch"
              << std::setw(15) << "Loss"
              << std::setw(15) << "Grad Norm" << std::endl;
    std::cout << std::string(40, '-') << std::endl;
}

void TrainingMetrics::print_progress(int epoch, float loss, float grad_norm) const {
    if (!verbose_) return;
    auto now = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_).count();

    std::cout << std::setw(10) << (epoch + 1)
              << std::setw(15) << std::fixed << std::setprecision(6) << loss
              << std::setw(15) << std::fixed << std::setprecision(4) << grad_norm
              << "  (" << elapsed << "ms)"
              << " [" << get_memory_mb() << "MB]"
              << std::endl;
}

float TrainingMetrics::best_loss() const {
    if (losses_.empty()) {
        throw std::logic_error("No epochs recorded");
    }
    return *std::min_element(losses_.begin(), losses_.end());
}

void TrainingMetrics::print_summary() const {
    if (!verbose_ || losses_.empty()) return;
    auto end = std::chrono::high_resolution_clock::now();
    auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_time_).count();

    std::cout << "\n=== Training Complete ===" << std::endl;
    std::cout << "Epochs: " << losses_.size() << "/" << total_epochs_ << std::endl;
    std::cout << "Total time: " << total_ms << "ms" << std::endl;
    std::cout << "Final loss: " << std::fixed << std::setprecision(4) << losses_.back() << std::endl;
    std::cout << "Best loss: " << std::fixed << std::setprecision(4) << best_loss() << std::endl;
}

void print_header(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << "\n" << std::endl;
}

void print_section(const std::string& title) {
    std::cout << "\n=== " << title << " ===" << std::endl;
}

} // namespace utils
