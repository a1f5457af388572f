// JSON result file written by rocket_cli --out
#pragma once

#include <optional>
#include <ostream>
#include "core/Array.hpp"

namespace rocket::io {

// Object with "c_star" and/or "C_f" members holding numbers or nested lists
void write_result_json(std::ostream& os, const std::optional<Array>& cstar,
                       const std::optional<Array>& cf);

} // namespace rocket::io
