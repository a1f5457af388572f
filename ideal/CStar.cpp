#include "ideal/CStar.hpp"
#include "core/Validation.hpp"
#include <cmath>

namespace rocket::ideal {

static inline double cstar(double g, double Rs, double T0) {
  return std::sqrt((1.0 / g) * std::pow((g + 1.0) / 2.0, (g + 1.0) / (g - 1.0)) * Rs * T0);
}

Array solve_cstar(const Array& gamma, const Array& Rs, const Array& T0) {
  require_gamma(gamma);
  require_none("Rs", Rs, [](double v) { return v <= 0.0; },
               "Specific gas constant must be > 0");
  require_none("T0", T0, [](double v) { return v <= 0.0; },
               "Stagnation temperature must be > 0");
  return broadcast_map(cstar, gamma, Rs, T0);
}

double solve_cstar(double gamma, double Rs, double T0) {
  return solve_cstar(Array(gamma), Array(Rs), Array(T0)).item();
}

} // namespace rocket::ideal
