#pragma once

#include "lattice.hpp"

namespace collisions {

//──────────────────────────────────────────────────────────────────────────────
//  D2Q9 equilibrium (second order Maxwell–Boltzmann expansion, cs² = 1/3):
//    f_i^eq = w_i ρ (1 + 3 c·u + 4.5 (c·u)² − 1.5 u²)
//──────────────────────────────────────────────────────────────────────────────
inline double Equilibrium(const int i, const double rho, const double ux, const double uy) {
    const double cu = cx[i] * ux + cy[i] * uy;
    const double u2 = ux * ux + uy * uy;
    return w[i] * rho * (1.0 + 3.0 * cu + 4.5 * cu * cu - 1.5 * u2);
}

//──────────────────────────────────────────────────────────────────────────────
//  BGK collision on the current slot, using the lattice moments:
//    f_i += ω (f_i^eq − f_i)
//──────────────────────────────────────────────────────────────────────────────
void CollideBGK(LatticeGrid& lattice, const double omega);

} // namespace collisions
