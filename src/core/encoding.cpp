/*
 * Output transcoding - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/core/encoding.hpp>
#include <cstdint>

namespace shellbridge {

const char* to_string(OutputEncoding e) {
    switch (e) {
        case OutputEncoding::Utf8: return "utf8";
        case OutputEncoding::Latin1: return "latin1";
        case OutputEncoding::Utf16Le: return "utf16le";
    }
    return "utf8";
}

std::optional<OutputEncoding> parse_encoding(std::string_view name) {
    if (name == "utf8" || name == "utf-8") return OutputEncoding::Utf8;
    if (name == "latin1" || name == "iso-8859-1") return OutputEncoding::Latin1;
    if (name == "utf16le" || name == "utf-16le") return OutputEncoding::Utf16Le;
    return std::nullopt;
}

static void append_code_point(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

static std::string latin1_to_utf8(const std::string& in) {
    std::string out;
    out.reserve(in.size() + in.size() / 8);
    for (unsigned char c : in) append_code_point(out, c);
    return out;
}

static std::string utf16le_to_utf8(const std::string& in) {
    constexpr std::uint32_t kReplacement = 0xFFFD;
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    // UTF-16LE byte order mark
    if (in.size() >= 2 && static_cast<unsigned char>(in[0]) == 0xFF && static_cast<unsigned char>(in[1]) == 0xFE) i = 2;
    auto unit_at = [&](size_t pos) -> std::uint32_t {
        return static_cast<unsigned char>(in[pos]) | (static_cast<std::uint32_t>(static_cast<unsigned char>(in[pos + 1])) << 8);
    };
    while (i + 1 < in.size()) {
        std::uint32_t u = unit_at(i);
        i += 2;
        if (u >= 0xD800 && u <= 0xDBFF) {
            if (i + 1 < in.size()) {
                std::uint32_t lo = unit_at(i);
                if (lo >= 0xDC00 && lo <= 0xDFFF) {
                    i += 2;
                    append_code_point(out, 0x10000 + ((u - 0xD800) << 10) + (lo - 0xDC00));
                    continue;
                }
            }
            append_code_point(out, kReplacement);
        } else if (u >= 0xDC00 && u <= 0xDFFF) {
            append_code_point(out, kReplacement);
        } else {
            append_code_point(out, u);
        }
    }
    if (i < in.size()) append_code_point(out, kReplacement); // dangling odd byte
    return out;
}

std::string to_utf8(std::string bytes, OutputEncoding from) {
    switch (from) {
        case OutputEncoding::Utf8: return bytes;
        case OutputEncoding::Latin1: return latin1_to_utf8(bytes);
        case OutputEncoding::Utf16Le: return utf16le_to_utf8(bytes);
    }
    return bytes;
}

} // namespace shellbridge
