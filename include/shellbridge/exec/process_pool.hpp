/*
 * Bounded process pool - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

namespace shellbridge {

using ProcessId = std::int64_t;
#ifdef _WIN32
using NativeProcessHandle = void*; // process HANDLE
#else
using NativeProcessHandle = int;   // process group id (== leader pid)
#endif

struct PoolStats {
    std::size_t active = 0;         // admitted slots not yet released
    std::size_t tracked = 0;        // live processes registered for kill_all
    std::size_t peak = 0;           // highest `active` seen
    std::size_t max_concurrent = 0;
    std::uint64_t admitted = 0;
    std::uint64_t refused = 0;
};

class ProcessPool;

// Admission ticket. Move-only; released exactly once, by release() or by
// the destructor, whichever comes first.
class PoolSlot {
public:
    PoolSlot() = default;
    PoolSlot(PoolSlot&& o) noexcept;
    PoolSlot& operator=(PoolSlot&& o) noexcept;
    PoolSlot(const PoolSlot&) = delete;
    PoolSlot& operator=(const PoolSlot&) = delete;
    ~PoolSlot() { release(); }

    // Bind the spawned process so kill_all() can reach it.
    void attach(ProcessId id, NativeProcessHandle handle);
    void release() noexcept;
    bool held() const { return m_pool != nullptr; }

private:
    friend class ProcessPool;
    explicit PoolSlot(ProcessPool* pool) : m_pool(pool) {}
    ProcessPool* m_pool = nullptr;
    std::optional<ProcessId> m_id;
};

// Refuses admission once max_concurrent slots are held; never queues.
class ProcessPool {
public:
    explicit ProcessPool(std::size_t max_concurrent);
    ProcessPool(const ProcessPool&) = delete;
    ProcessPool& operator=(const ProcessPool&) = delete;

    // nullopt when at capacity or closed.
    std::optional<PoolSlot> try_admit();

    // Graceful signal to every tracked process, then forget them. Does not
    // wait. Returns the number of processes signalled.
    std::size_t kill_all();

    // Refuse all later admissions.
    void close();
    bool closed() const;

    std::size_t max_concurrent() const { return m_max; }
    std::size_t active() const;
    std::size_t tracked() const;
    PoolStats stats() const;

private:
    friend class PoolSlot;
    void track(ProcessId id, NativeProcessHandle handle);
    void release(const std::optional<ProcessId>& id) noexcept;

    const std::size_t m_max;
    mutable std::mutex m_mutex;
    std::map<ProcessId, NativeProcessHandle> m_tracked;
    std::size_t m_active = 0;
    std::size_t m_peak = 0;
    std::uint64_t m_admitted = 0;
    std::uint64_t m_refused = 0;
    bool m_closed = false;
};

} // namespace shellbridge
