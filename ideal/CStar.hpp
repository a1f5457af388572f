// Characteristic velocity c* of an ideal, choked rocket nozzle
#pragma once

#include "core/Array.hpp"

namespace rocket::ideal {

// c* = sqrt( (1/gamma) * ((gamma+1)/2)^((gamma+1)/(gamma-1)) * Rs * T0 )
// gamma: ratio of specific heats, 1 < gamma < 1.8
// Rs: specific gas constant [J/(kg*K)], > 0
// T0: stagnation temperature [K], > 0
// Returns c* [m/s]. Inputs are validated in the order above before anything
// is evaluated; array inputs broadcast to a common shape.
double solve_cstar(double gamma, double Rs, double T0);
Array solve_cstar(const Array& gamma, const Array& Rs, const Array& T0);

} // namespace rocket::ideal
