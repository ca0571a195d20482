#pragma once

// ============================================================
// base64.hpp -- RFC 4648 base64 (standard alphabet, padded)
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

namespace base64 {

inline std::string encode(const u8* data, size_t len) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        u32 v = ((u32)data[i] << 16) | ((u32)data[i + 1] << 8) | data[i + 2];
        out += table[(v >> 18) & 0x3F];
        out += table[(v >> 12) & 0x3F];
        out += table[(v >>  6) & 0x3F];
        out += table[ v        & 0x3F];
    }

    size_t rest = len - i;
    if (rest == 1) {
        u32 v = (u32)data[i] << 16;
        out += table[(v >> 18) & 0x3F];
        out += table[(v >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        u32 v = ((u32)data[i] << 16) | ((u32)data[i + 1] << 8);
        out += table[(v >> 18) & 0x3F];
        out += table[(v >> 12) & 0x3F];
        out += table[(v >>  6) & 0x3F];
        out += '=';
    }
    return out;
}

inline std::string encode(const std::vector<u8>& data) {
    return encode(data.data(), data.size());
}

// Strict decode: length must be a multiple of 4, padding only at the end.
// Returns false on any violation; out is unspecified in that case.
inline bool decode(const std::string& text, std::vector<u8>& out) {
    auto value_of = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    out.clear();
    if (text.size() % 4 != 0) return false;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        bool last_quad = (i + 4 == text.size());
        int pad = 0;
        if (last_quad) {
            if (text[i + 3] == '=') ++pad;
            if (text[i + 2] == '=') ++pad;
            // "x==" patterns only; "=x" in the middle is invalid
            if (pad == 1 && text[i + 2] == '=') return false;
        }

        int v[4];
        for (int k = 0; k < 4 - pad; ++k) {
            v[k] = value_of(text[i + k]);
            if (v[k] < 0) return false;
        }
        for (int k = 4 - pad; k < 4; ++k) v[k] = 0;

        u32 triple = ((u32)v[0] << 18) | ((u32)v[1] << 12) | ((u32)v[2] << 6) | (u32)v[3];
        out.push_back((u8)(triple >> 16));
        if (pad < 2) out.push_back((u8)(triple >> 8));
        if (pad < 1) out.push_back((u8)triple);
    }
    return true;
}

} // namespace base64
