/*
 * Bounded process pool - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/exec/process_pool.hpp>
#include <algorithm>

#ifdef _WIN32
#include <windows.h>
#else
#include <csignal>
#include <sys/types.h>
#endif

namespace shellbridge {

namespace {

void send_graceful(ProcessId id, NativeProcessHandle handle) {
#ifdef _WIN32
    if (!GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, static_cast<DWORD>(id)))
        TerminateProcess(static_cast<HANDLE>(handle), 1);
#else
    (void)id;
    ::kill(-handle, SIGTERM);
#endif
}

} // namespace

PoolSlot::PoolSlot(PoolSlot&& o) noexcept : m_pool(o.m_pool), m_id(o.m_id) {
    o.m_pool = nullptr;
    o.m_id.reset();
}

PoolSlot& PoolSlot::operator=(PoolSlot&& o) noexcept {
    if (this != &o) {
        release();
        m_pool = o.m_pool;
        m_id = o.m_id;
        o.m_pool = nullptr;
        o.m_id.reset();
    }
    return *this;
}

void PoolSlot::attach(ProcessId id, NativeProcessHandle handle) {
    if (!m_pool) return;
    m_id = id;
    m_pool->track(id, handle);
}

void PoolSlot::release() noexcept {
    if (!m_pool) return;
    ProcessPool* pool = m_pool;
    m_pool = nullptr;
    pool->release(m_id);
    m_id.reset();
}

ProcessPool::ProcessPool(std::size_t max_concurrent) : m_max(std::max<std::size_t>(1, max_concurrent)) {}

std::optional<PoolSlot> ProcessPool::try_admit() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_closed || m_active >= m_max) {
        ++m_refused;
        return std::nullopt;
    }
    ++m_active;
    ++m_admitted;
    m_peak = std::max(m_peak, m_active);
    return PoolSlot(this);
}

void ProcessPool::track(ProcessId id, NativeProcessHandle handle) {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_tracked[id] = handle;
}

void ProcessPool::release(const std::optional<ProcessId>& id) noexcept {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (id) m_tracked.erase(*id);
    if (m_active > 0) --m_active;
}

std::size_t ProcessPool::kill_all() {
    std::lock_guard<std::mutex> lk(m_mutex);
    std::size_t n = m_tracked.size();
    for (auto& [id, handle] : m_tracked) send_graceful(id, handle);
    m_tracked.clear();
    return n;
}

void ProcessPool::close() {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_closed = true;
}

bool ProcessPool::closed() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_closed;
}

std::size_t ProcessPool::active() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_active;
}

std::size_t ProcessPool::tracked() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_tracked.size();
}

PoolStats ProcessPool::stats() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    PoolStats s;
    s.active = m_active;
    s.tracked = m_tracked.size();
    s.peak = m_peak;
    s.max_concurrent = m_max;
    s.admitted = m_admitted;
    s.refused = m_refused;
    return s;
}

} // namespace shellbridge
