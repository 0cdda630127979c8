#include "kernel/Executor.h"
#include <algorithm>
#include <omp.h>

void SequentialExecutor::forEach(std::size_t count, const std::function<void(std::size_t)>& task) {
    for (std::size_t i = 0; i < count; ++i) task(i);
}

OpenMPExecutor::OpenMPExecutor(std::size_t threads) : threads_(std::max<std::size_t>(1, threads)) {}

void OpenMPExecutor::forEach(std::size_t count, const std::function<void(std::size_t)>& task) {
    if (count == 0) return;
    const int team = static_cast<int>(std::min(threads_, count));
    const long n = static_cast<long>(count);

    #pragma omp parallel for num_threads(team) schedule(dynamic, 1)
    for (long i = 0; i < n; ++i) {
        task(static_cast<std::size_t>(i));
    }
}

std::unique_ptr<Executor> makeExecutor(bool parallel, std::size_t threads) {
    if (!parallel) return std::make_unique<SequentialExecutor>();
    if (threads == 0) {
        threads = static_cast<std::size_t>(std::max(1, omp_get_num_procs()));
    }
    return std::make_unique<OpenMPExecutor>(threads);
}
