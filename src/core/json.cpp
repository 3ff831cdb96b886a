/*
 * Minimal JSON writer - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/core/json.hpp>
#include <cmath>
#include <cstdio>

namespace shellbridge::json {

std::string escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 16);
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

void Object::key(const std::string& k) {
    if (!m_body.empty()) m_body.push_back(',');
    m_body.push_back('"');
    m_body += escape(k);
    m_body += "\":";
}

Object& Object::add(const std::string& k, std::string_view value) {
    key(k);
    m_body.push_back('"');
    m_body += escape(value);
    m_body.push_back('"');
    return *this;
}

Object& Object::add(const std::string& k, bool value) {
    return add_raw(k, value ? "true" : "false");
}

Object& Object::add(const std::string& k, double value) {
    if (!std::isfinite(value)) return add_raw(k, "null");
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    return add_raw(k, buf);
}

Object& Object::add(const std::string& k, const std::vector<std::string>& values) {
    std::string arr = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) arr.push_back(',');
        arr.push_back('"');
        arr += escape(values[i]);
        arr.push_back('"');
    }
    arr.push_back(']');
    return add_raw(k, arr);
}

Object& Object::add_raw(const std::string& k, const std::string& value) {
    key(k);
    m_body += value;
    return *this;
}

} // namespace shellbridge::json
