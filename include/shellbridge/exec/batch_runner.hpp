/*
 * Batch runner - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/core/options.hpp>
#include <shellbridge/core/result.hpp>
#include <shellbridge/exec/executor.hpp>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace shellbridge {

struct BatchProgress {
    std::size_t index = 0;     // input position of the item that finished
    std::size_t completed = 0; // items finished so far, this one included
    std::size_t total = 0;
    const CommandResult* last_result = nullptr;
};

using ProgressCallback = std::function<void(const BatchProgress&)>;

// Runs commands in waves no wider than the pool. Each wave runs
// concurrently and is joined before the next starts. The result vector
// always matches the input in length and order; a fault in one item
// becomes that item's Failure. When the OS refuses a worker thread the
// item runs on the calling thread instead.
class BatchRunner {
public:
    explicit BatchRunner(Executor& executor) : m_executor(executor) {}
    virtual ~BatchRunner() = default;

    std::vector<CommandResult> run_batch(const std::vector<std::string>& commands,
                                         const ExecutionOptions& options = ExecutionOptions(),
                                         const ProgressCallback& progress = nullptr);

    std::size_t wave_size() const;

protected:
    // Starts one wave item. Throws std::system_error when no thread can be created.
    virtual std::thread start_worker(std::function<void()> body);

private:
    CommandResult run_one(const std::string& command, const ExecutionOptions& options);

    Executor& m_executor;
};

} // namespace shellbridge
