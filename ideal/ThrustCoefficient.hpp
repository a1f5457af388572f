// Thrust coefficient C_f of an ideal, choked rocket nozzle
#pragma once

#include "core/Array.hpp"

namespace rocket::ideal {

// C_f = sqrt( 2*gamma^2/(gamma-1) * (2/(gamma+1))^((gamma+1)/(gamma-1))
//               * (1 - (pe/p0)^((gamma-1)/gamma))
//             + (pe/p0 - pa/p0) * Ae/A* )
// gamma: ratio of specific heats, 1 < gamma < 1.8
// ratio_pe_p0: exit to stagnation pressure, in [0, 1)
// ratio_pa_p0: ambient to stagnation pressure, in [0, 1)
// ratio_Ae_Astar: exit to throat area, >= 1
//
// The pressure term sits under the root together with the momentum term;
// textbook tables that add it outside the root give slightly lower values.
// The radicand is not guarded: strongly over-expanded inputs that are each
// in range can drive it negative, and the result is then NaN.
double solve_cf(double gamma, double ratio_pe_p0, double ratio_pa_p0, double ratio_Ae_Astar);
Array solve_cf(const Array& gamma, const Array& ratio_pe_p0, const Array& ratio_pa_p0,
               const Array& ratio_Ae_Astar);

} // namespace rocket::ideal
