/*
 * FIFO-bounded memo table - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <algorithm>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace shellbridge {

// String-keyed memo table with insertion-order eviction. When an insert
// would exceed capacity, the oldest `evict_batch` keys are dropped in one
// pass. Values must be pure functions of the key: a racing second insert
// for the same key is discarded.
template <typename V>
class BoundedCache {
public:
    explicit BoundedCache(std::size_t capacity, std::size_t evict_batch = 0)
        : m_capacity(capacity),
          m_evict_batch(evict_batch ? evict_batch : std::max<std::size_t>(1, capacity / 5)) {}

    std::optional<V> find(const std::string& key) const {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_map.find(key);
        if (it == m_map.end()) return std::nullopt;
        return it->second;
    }

    void insert(const std::string& key, V value) {
        if (m_capacity == 0) return;
        std::lock_guard<std::mutex> lk(m_mutex);
        if (m_map.count(key)) return;
        if (m_map.size() >= m_capacity) {
            std::size_t n = std::min(m_evict_batch, m_order.size());
            for (std::size_t i = 0; i < n; ++i) {
                m_map.erase(m_order.front());
                m_order.pop_front();
            }
        }
        m_map.emplace(key, std::move(value));
        m_order.push_back(key);
    }

    std::size_t size() const { std::lock_guard<std::mutex> lk(m_mutex); return m_map.size(); }
    std::size_t capacity() const { return m_capacity; }
    std::size_t evict_batch() const { return m_evict_batch; }

    void clear() {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_map.clear();
        m_order.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, V> m_map;
    std::deque<std::string> m_order;
    std::size_t m_capacity;
    std::size_t m_evict_batch;
};

} // namespace shellbridge
