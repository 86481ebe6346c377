#include "collisions.hpp"

namespace collisions {

void CollideBGK(LatticeGrid& lattice, const double omega) {
    const int NX = lattice.nx();
    const int NY = lattice.ny();
    std::vector<double>& f = lattice.current();
    const std::vector<double>& rho = lattice.rho();
    const std::vector<double>& ux = lattice.ux();
    const std::vector<double>& uy = lattice.uy();

    #pragma omp parallel for collapse(2) schedule(static)
    for (int y = 0; y < NY; ++y) {
        for (int x = 0; x < NX; ++x) {
            const int idx = INDEX(x, y, NX, NY);
            const double rho_loc = rho[idx];
            const double ux_loc = ux[idx];
            const double uy_loc = uy[idx];

            for (int i = 0; i < Q; ++i) {
                const int idx_3 = INDEX(x, y, i, NX, NY);
                f[idx_3] += omega * (Equilibrium(i, rho_loc, ux_loc, uy_loc) - f[idx_3]);
            }
        }
    }
}

} // namespace collisions
