#include "ndl-core/utf8.hh"

namespace ndl {

    static size_t sequence_length(unsigned char lead) {
        if (lead < 0x80) { return 1; }
        if ((lead & 0xE0) == 0xC0) { return 2; }
        if ((lead & 0xF0) == 0xE0) { return 3; }
        if ((lead & 0xF8) == 0xF0) { return 4; }
        return 0;
    }

    static uint32_t decode_at(std::string_view text, size_t offset, size_t len) {
        auto byte = [&](size_t i) { return static_cast<unsigned char>(text[offset + i]); };
        switch (len) {
            case 1: return byte(0);
            case 2: return ((byte(0) & 0x1Fu) << 6) | (byte(1) & 0x3Fu);
            case 3: return ((byte(0) & 0x0Fu) << 12) | ((byte(1) & 0x3Fu) << 6) | (byte(2) & 0x3Fu);
            case 4: return ((byte(0) & 0x07u) << 18) | ((byte(1) & 0x3Fu) << 12) | ((byte(2) & 0x3Fu) << 6) | (byte(3) & 0x3Fu);
        }
        return 0;
    }

    bool utf8_is_valid(std::string_view text) {
        size_t i = 0;
        while (i < text.size()) {
            size_t len = sequence_length(static_cast<unsigned char>(text[i]));
            if (len == 0 || i + len > text.size()) {
                return false;
            }
            for (size_t j = 1; j < len; j++) {
                if ((static_cast<unsigned char>(text[i + j]) & 0xC0) != 0x80) {
                    return false;
                }
            }
            uint32_t cp = decode_at(text, i, len);
            // overlong encodings, surrogates, out of range
            uint32_t const min_for_len[5] = {0, 0, 0x80, 0x800, 0x10000};
            if (cp < min_for_len[len] || cp > 0x10FFFF || (0xD800 <= cp && cp <= 0xDFFF)) {
                return false;
            }
            i += len;
        }
        return true;
    }

    std::vector<size_t> utf8_boundaries(std::string_view text) {
        std::vector<size_t> out;
        out.reserve(text.size() + 1);
        size_t i = 0;
        while (i < text.size()) {
            out.push_back(i);
            size_t len = sequence_length(static_cast<unsigned char>(text[i]));
            i += (len == 0 ? 1 : len);
        }
        out.push_back(text.size());
        return out;
    }

    size_t utf8_length(std::string_view text) {
        size_t count = 0;
        for (char c: text) {
            if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
                count++;
            }
        }
        return count;
    }

    bool is_unicode_whitespace(uint32_t cp) {
        return (
            (0x09 <= cp && cp <= 0x0D) || cp == 0x20 || cp == 0x85 || cp == 0xA0 || cp == 0x1680 ||
            (0x2000 <= cp && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 || cp == 0x202F ||
            cp == 0x205F || cp == 0x3000
        );
    }

    std::string_view utf8_trim_start(std::string_view text) {
        size_t i = 0;
        while (i < text.size()) {
            size_t len = sequence_length(static_cast<unsigned char>(text[i]));
            if (len == 0 || i + len > text.size() || !is_unicode_whitespace(decode_at(text, i, len))) {
                break;
            }
            i += len;
        }
        return text.substr(i);
    }

    std::string_view utf8_trim_end(std::string_view text) {
        std::vector<size_t> bounds = utf8_boundaries(text);
        size_t end = bounds.size() - 1;
        while (end > 0) {
            size_t start = bounds[end - 1];
            if (!is_unicode_whitespace(decode_at(text, start, bounds[end] - start))) {
                break;
            }
            end--;
        }
        return text.substr(0, bounds[end]);
    }

}   // namespace ndl
