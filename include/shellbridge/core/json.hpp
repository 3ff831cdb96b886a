/*
 * Minimal JSON writer - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace shellbridge::json {

// Escape for use inside a JSON string literal (no surrounding quotes).
std::string escape(std::string_view in);

// Single-line JSON object builder. Keys are emitted in insertion order.
class Object {
public:
    Object& add(const std::string& key, std::string_view value);
    Object& add(const std::string& key, const char* value) { return add(key, std::string_view(value)); }
    Object& add(const std::string& key, bool value);
    Object& add(const std::string& key, double value);
    Object& add(const std::string& key, const std::vector<std::string>& values);

    template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Object& add(const std::string& key, T value) { return add_raw(key, std::to_string(value)); }

    // value must already be valid JSON (nested object, array, null)
    Object& add_raw(const std::string& key, const std::string& value);
    Object& add(const std::string& key, const Object& nested) { return add_raw(key, nested.str()); }

    bool empty() const { return m_body.empty(); }
    std::string str() const { return "{" + m_body + "}"; }

private:
    void key(const std::string& k);
    std::string m_body;
};

} // namespace shellbridge::json
