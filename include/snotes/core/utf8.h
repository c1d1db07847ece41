#pragma once

#include <cstddef>
#include <string_view>

namespace snotes::core {

// is_valid_utf8 reports whether bytes form well-formed UTF-8 (RFC 3629):
// no overlong forms, no surrogates, nothing above U+10FFFF, no truncated sequences.
[[nodiscard]] bool is_valid_utf8(std::string_view bytes);

// utf8_codepoint_count counts code points in well-formed UTF-8.
// For malformed input each invalid byte counts as one.
[[nodiscard]] std::size_t utf8_codepoint_count(std::string_view bytes);

}  // namespace snotes::core
