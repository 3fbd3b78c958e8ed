#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "util/errors.hpp"
#include "util/strings.hpp"

namespace csvsa {

// Text is held as UTF-8 in memory; these are the on-disk encodings we transcode from/to.
enum class text_encoding { auto_detect, utf8, utf8_sig, latin1, ascii };

inline const char* to_string(text_encoding e) {
    switch (e) {
        case text_encoding::auto_detect: return "auto";
        case text_encoding::utf8:        return "utf-8";
        case text_encoding::utf8_sig:    return "utf-8-sig";
        case text_encoding::latin1:      return "latin-1";
        default:                         return "ascii";
    }
}

inline bool parse_encoding_name(std::string_view name, text_encoding& out) {
    const std::string n = to_lower(trim_view(name));
    if (n == "auto")                                  { out = text_encoding::auto_detect; return true; }
    if (n == "utf-8" || n == "utf8")                  { out = text_encoding::utf8;        return true; }
    if (n == "utf-8-sig" || n == "utf8-sig")          { out = text_encoding::utf8_sig;    return true; }
    if (n == "latin-1" || n == "latin1" || n == "iso-8859-1" || n == "iso8859-1")
                                                      { out = text_encoding::latin1;      return true; }
    if (n == "ascii" || n == "us-ascii")              { out = text_encoding::ascii;       return true; }
    return false;
}

inline bool has_utf8_bom(std::string_view bytes) {
    return bytes.size() >= 3 &&
           static_cast<unsigned char>(bytes[0]) == 0xEF &&
           static_cast<unsigned char>(bytes[1]) == 0xBB &&
           static_cast<unsigned char>(bytes[2]) == 0xBF;
}

// Returns the offset of the first invalid byte, or npos if the whole buffer is well-formed UTF-8.
inline std::size_t find_invalid_utf8(std::string_view s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80)                { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return i;
        if (i + len > n) return i;
        for (std::size_t k = 1; k < len; ++k) {
            const unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, beyond U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return i;
        }
        i += len;
    }
    return std::string_view::npos;
}

inline text_encoding detect_encoding(std::string_view bytes) {
    if (has_utf8_bom(bytes)) return text_encoding::utf8_sig;
    if (find_invalid_utf8(bytes) == std::string_view::npos) return text_encoding::utf8;
    return text_encoding::latin1;
}

// ---------- decode: file bytes -> UTF-8 ----------
inline std::string decode_to_utf8(std::string bytes, text_encoding enc) {
    if (enc == text_encoding::auto_detect) enc = detect_encoding(bytes);

    switch (enc) {
        case text_encoding::utf8:
        case text_encoding::utf8_sig: {
            if (has_utf8_bom(bytes)) bytes.erase(0, 3);
            const auto bad = find_invalid_utf8(bytes);
            if (bad != std::string::npos)
                throw input_error(fmt::format("invalid UTF-8 sequence at byte offset {}", bad));
            return bytes;
        }
        case text_encoding::ascii: {
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                if (static_cast<unsigned char>(bytes[i]) >= 0x80)
                    throw input_error(fmt::format("non-ASCII byte 0x{:02X} at offset {}",
                                                  static_cast<unsigned char>(bytes[i]), i));
            }
            return bytes;
        }
        case text_encoding::latin1: {
            std::string out;
            out.reserve(bytes.size() + bytes.size() / 8);
            for (unsigned char c : bytes) {
                if (c < 0x80) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
                    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
                }
            }
            return out;
        }
        default:
            throw input_error("unsupported input encoding");
    }
}

// ---------- encode: UTF-8 -> file bytes ----------
inline std::string encode_from_utf8(std::string_view text, text_encoding enc) {
    switch (enc) {
        case text_encoding::utf8:
            return std::string(text);
        case text_encoding::utf8_sig:
            return std::string("\xEF\xBB\xBF") + std::string(text);
        case text_encoding::ascii:
        case text_encoding::latin1: {
            const std::uint32_t limit = enc == text_encoding::ascii ? 0x7F : 0xFF;
            std::string out;
            out.reserve(text.size());
            for (std::size_t i = 0; i < text.size();) {
                const unsigned char c = static_cast<unsigned char>(text[i]);
                std::uint32_t cp = c;
                std::size_t len = 1;
                if ((c & 0xE0) == 0xC0 && i + 1 < text.size()) {
                    cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(text[i + 1]) & 0x3Fu);
                    len = 2;
                } else if (c >= 0x80) {
                    // three and four byte sequences are all above U+07FF
                    cp = 0x800;
                }
                if (cp > limit)
                    throw output_error(fmt::format("character at offset {} is not representable in {}",
                                                   i, to_string(enc)));
                out.push_back(static_cast<char>(cp));
                i += len;
            }
            return out;
        }
        default:
            throw output_error(fmt::format("unsupported output encoding '{}'", to_string(enc)));
    }
}

}
