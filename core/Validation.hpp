// Whole-array domain checks shared by the nozzle relations
#pragma once

#include <algorithm>
#include <string>
#include "core/Array.hpp"
#include "core/Errors.hpp"

namespace rocket {

// Throws a domain error naming `argument` if any element satisfies `violates`.
// Predicates describe the violation, so NaN elements never trip a check.
template <typename Violation>
void require_none(const std::string& argument, const Array& a, Violation violates,
                  const std::string& msg) {
  const auto& v = a.values();
  if (std::any_of(v.begin(), v.end(), violates)) domain_error(argument, msg);
}

// Open interval (1, 1.8) shared by both relations
inline void require_gamma(const Array& gamma) {
  require_none("gamma", gamma, [](double g) { return g <= 1.0 || g >= 1.8; },
               "gamma must be > 1 and < 1.8");
}

} // namespace rocket
