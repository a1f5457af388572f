// Text <-> Array conversion for command-line and config values
#pragma once

#include <string>
#include "core/Array.hpp"

namespace rocket::io {

// Parses a number ("1.2"), a bare comma list ("1.2,1.3") or a nested bracket
// list ("[[1, 2], [3, 4]]"). Non-numeric elements throw a type error naming
// `argument`; ragged nesting throws a shape error.
Array parse_array(const std::string& argument, const std::string& text);

// Scalar as a plain number, N-d arrays as nested brackets (round-trip precision)
std::string format_array(const Array& a);

} // namespace rocket::io
