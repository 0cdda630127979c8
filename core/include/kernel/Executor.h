#ifndef EXECUTOR_H
#define EXECUTOR_H

#include <cstddef>
#include <functional>
#include <memory>

/**
 * Runs count independent tasks and returns once all of them finished.
 * Tasks must not throw; the dispatcher wraps every task before handing it over.
 */
class Executor {
public:
    virtual ~Executor() = default;

    virtual void forEach(std::size_t count, const std::function<void(std::size_t)>& task) = 0;
    virtual std::size_t concurrency() const = 0;
    virtual const char* name() const = 0;
};

// In order, on the calling thread.
class SequentialExecutor : public Executor {
public:
    void forEach(std::size_t count, const std::function<void(std::size_t)>& task) override;
    std::size_t concurrency() const override { return 1; }
    const char* name() const override { return "sequential"; }
};

// OpenMP team of a fixed size, dynamic schedule (task costs vary widely).
class OpenMPExecutor : public Executor {
public:
    explicit OpenMPExecutor(std::size_t threads);

    void forEach(std::size_t count, const std::function<void(std::size_t)>& task) override;
    std::size_t concurrency() const override { return threads_; }
    const char* name() const override { return "openmp"; }

private:
    std::size_t threads_;
};

// threads == 0 means one per available processor.
std::unique_ptr<Executor> makeExecutor(bool parallel, std::size_t threads);

#endif
