/*
 * Batch runner - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/exec/batch_runner.hpp>
#include <shellbridge/core/time.hpp>
#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace shellbridge {

std::size_t BatchRunner::wave_size() const {
    return std::max<std::size_t>(1, m_executor.pool().max_concurrent());
}

std::thread BatchRunner::start_worker(std::function<void()> body) {
    return std::thread(std::move(body));
}

CommandResult BatchRunner::run_one(const std::string& command, const ExecutionOptions& options) {
    try {
        return m_executor.run(command, options);
    } catch (const std::exception& ex) {
        RunRecord rec;
        rec.command = command;
        rec.exit_code = -1;
        rec.timestamp = iso8601_now();
        ExecError e;
        e.category = ErrorCategory::Internal;
        e.code = error_code::Internal;
        e.message = ex.what();
        return CommandResult::failure(std::move(rec), std::move(e));
    }
}

std::vector<CommandResult> BatchRunner::run_batch(const std::vector<std::string>& commands,
                                                  const ExecutionOptions& options,
                                                  const ProgressCallback& progress) {
    const std::size_t total = commands.size();
    std::vector<std::optional<CommandResult>> slots(total);
    std::mutex progress_mutex;
    std::size_t completed = 0;
    const std::size_t wave = wave_size();

    auto run_item = [&](std::size_t i) {
        slots[i] = run_one(commands[i], options);
        if (progress) {
            std::lock_guard<std::mutex> lk(progress_mutex);
            BatchProgress p;
            p.index = i;
            p.completed = ++completed;
            p.total = total;
            p.last_result = &*slots[i];
            progress(p);
        }
    };

    for (std::size_t begin = 0; begin < total; begin += wave) {
        const std::size_t end = std::min(total, begin + wave);
        std::vector<std::thread> workers;
        workers.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            try {
                workers.push_back(start_worker([&run_item, i] { run_item(i); }));
            } catch (const std::system_error&) {
                run_item(i);
            }
        }
        for (auto& w : workers) w.join();
    }

    std::vector<CommandResult> results;
    results.reserve(total);
    for (auto& s : slots) results.push_back(std::move(*s));
    return results;
}

} // namespace shellbridge
