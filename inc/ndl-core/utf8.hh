#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace ndl {

    bool utf8_is_valid(std::string_view text);

    // byte offset of each code point, followed by `text.size()`
    std::vector<size_t> utf8_boundaries(std::string_view text);
    size_t utf8_length(std::string_view text);

    bool is_unicode_whitespace(uint32_t code_point);
    std::string_view utf8_trim_start(std::string_view text);
    std::string_view utf8_trim_end(std::string_view text);

}   // namespace ndl
