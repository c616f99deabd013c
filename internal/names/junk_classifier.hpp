#pragma once

#include <string_view>

namespace roster::names {

/*
  Junk classifier.

  True when `name` is not a usable person name: titles, placeholders,
  OCR garbage, organizations, redaction markers and the like. Any
  single rule matching is enough. Lengths count UTF-8 code points.
*/
bool IsJunkName(std::string_view name);

} // namespace roster::names
