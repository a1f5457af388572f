// Ideal rocket nozzle relations: characteristic velocity and thrust coefficient.
// Assumes ideal gas, isentropic and adiabatic flow through a converging-diverging
// nozzle; SI inputs.
#pragma once

#include "ideal/CStar.hpp"
#include "ideal/ThrustCoefficient.hpp"
