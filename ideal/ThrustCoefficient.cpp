#include "ideal/ThrustCoefficient.hpp"
#include "core/Validation.hpp"
#include <cmath>

namespace rocket::ideal {

static inline double cf(double g, double pe, double pa, double area) {
  const double momentum = (2.0 * g * g / (g - 1.0))
                        * std::pow(2.0 / (g + 1.0), (g + 1.0) / (g - 1.0))
                        * (1.0 - std::pow(pe, (g - 1.0) / g));
  const double pressure = (pe - pa) * area;
  return std::sqrt(momentum + pressure);
}

static inline bool outside_unit_interval(double r) { return r < 0.0 || r >= 1.0; }

Array solve_cf(const Array& gamma, const Array& ratio_pe_p0, const Array& ratio_pa_p0,
               const Array& ratio_Ae_Astar) {
  require_gamma(gamma);
  require_none("ratio_pe_p0", ratio_pe_p0, outside_unit_interval,
               "ratio_pe_p0 must be in [0, 1)");
  require_none("ratio_pa_p0", ratio_pa_p0, outside_unit_interval,
               "ratio_pa_p0 must be in [0, 1)");
  require_none("ratio_Ae_Astar", ratio_Ae_Astar, [](double v) { return v < 1.0; },
               "ratio_Ae_Astar must be >= 1");
  return broadcast_map(cf, gamma, ratio_pe_p0, ratio_pa_p0, ratio_Ae_Astar);
}

double solve_cf(double gamma, double ratio_pe_p0, double ratio_pa_p0, double ratio_Ae_Astar) {
  return solve_cf(Array(gamma), Array(ratio_pe_p0), Array(ratio_pa_p0), Array(ratio_Ae_Astar)).item();
}

} // namespace rocket::ideal
