/*
 * Capped output capture - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace shellbridge {

// Collects chunks as they arrive and joins them once in take().
// Bytes past the cap are dropped and the buffer is marked truncated.
class OutputBuffer {
public:
    explicit OutputBuffer(std::size_t cap) : m_cap(cap) {}

    void append(const char* data, std::size_t n) {
        if (n == 0) return;
        std::size_t room = m_size < m_cap ? m_cap - m_size : 0;
        if (n > room) { m_truncated = true; n = room; }
        if (n == 0) return;
        m_chunks.emplace_back(data, n);
        m_size += n;
    }

    std::string take() {
        std::string out;
        out.reserve(m_size);
        for (auto& c : m_chunks) out += c;
        m_chunks.clear();
        m_size = 0;
        return out;
    }

    std::size_t size() const { return m_size; }
    bool truncated() const { return m_truncated; }

private:
    std::vector<std::string> m_chunks;
    std::size_t m_size = 0;
    std::size_t m_cap;
    bool m_truncated = false;
};

} // namespace shellbridge
