#pragma once

#include <string>

namespace snotes::core {

// PasteToken is the externally visible 11-character base62 key of a paste.
// A vocabulary type so token strings cannot be confused with content or hashes.
struct PasteToken {
  std::string value;
  auto operator<=>(const PasteToken&) const = default;
};

}  // namespace snotes::core
