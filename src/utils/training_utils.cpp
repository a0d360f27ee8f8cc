#include "utils/training_utils.h"
#include "tinyformer/blas_wrapper.h"
#include <cmath>

#ifdef __APPLE__
    #include <mach/mach.h>
#elif defined(__linux__)
    #include <fstream>
    #include <unistd.h>
#endif

namespace utils {

float compute_grad_norm(const std::vector<std::shared_ptr<tinyformer::Variable>>& params) {
    float grad_norm = 0.0f;
    for (const auto& param : params) {
        if (!param->requiresGrad()) continue;
        const tinyformer::Tensor& grad = param->getGrad();
        grad_norm += tinyformer::blas_sumsq(grad.raw(), grad.numel());
    }
    return std::sqrt(grad_norm);
}

size_t count_parameters(const std::vector<std::shared_ptr<tinyformer::Variable>>& params) {
    size_t total = 0;
    for (const auto& param : params) {
        if (param->requiresGrad()) total += param->getData().numel();
    }
    return total;
}

size_t get_memory_mb() {
#ifdef __APPLE__
    struct task_basic_info info;
    mach_msg_type_number_t size = sizeof(info);
    kern_return_t kerr = task_info(mach_task_self(),
                                    TASK_BASIC_INFO,
                                    (task_info_t)&info,
                                    &size);
    return (kerr == KERN_SUCCESS) ? info.resident_size / (1024 * 1024) : 0;
#elif defined(__linux__)
    long rss = 0L;
    std::ifstream statm("/proc/self/statm");
    if (statm >> rss >> rss) {
        return (rss * sysconf(_SC_PAGESIZE)) / (1024 * 1024);
    }
    return 0L;
#else
    return 0L;
#endif
}

} // namespace utils
