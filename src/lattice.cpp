#include "lattice.hpp"
#include "errors.hpp"

#include <algorithm>
#include <climits>
#include <new>
#include <string>

int ObstacleMask::count() const {
    return static_cast<int>(std::count(solid.begin(), solid.end(), true));
}

LatticeGrid::LatticeGrid(const int _NX, const int _NY)
    : NX(_NX), NY(_NY)
{
    const std::string dims = std::to_string(NX) + "x" + std::to_string(NY);
    // Edge copies (row 1 -> row 0, row NY-2 -> row NY-1) collide below 3 cells
    if (NX < kMinGridSize || NY < kMinGridSize) {
        throw InvalidInput("Grid " + dims + " too small: NX and NY must be >= " +
                           std::to_string(kMinGridSize));
    }
    // Populations are addressed with int indices
    const long long size_distr = static_cast<long long>(NX) * NY * Q;
    if (size_distr > INT_MAX) {
        throw ResourceExhaustion("Grid " + dims + " exceeds the lattice index space (" +
                                 std::to_string(size_distr) + " populations)");
    }

    try {
        f.assign(size_distr, 0.0);
        f_staging.assign(size_distr, 0.0);

        const int size_macro = NX * NY;
        rho_.assign(size_macro, 0.0);
        ux_.assign(size_macro, 0.0);
        uy_.assign(size_macro, 0.0);
    } catch (const std::bad_alloc&) {
        throw ResourceExhaustion("Cannot allocate lattice for grid " + dims + " (" +
                                 std::to_string(2 * size_distr * sizeof(double) / (1024 * 1024)) +
                                 " MiB of populations)");
    }
}

//──────────────────────────────────────────────────────────────────────────────
//  Uniform stationary state: F_k = 1 for every cell and direction.
//  UpdateMacro overwrites the moments on the first step anyway.
//──────────────────────────────────────────────────────────────────────────────
void LatticeGrid::Initialize() {
    std::fill(f.begin(), f.end(), 1.0);
    std::fill(f_staging.begin(), f_staging.end(), 0.0);
    std::fill(rho_.begin(), rho_.end(), static_cast<double>(Q));
    std::fill(ux_.begin(), ux_.end(), 0.0);
    std::fill(uy_.begin(), uy_.end(), 0.0);
}

void LatticeGrid::UpdateMacro() {
    #pragma omp parallel for collapse(2) schedule(static)
    for (int y = 0; y < NY; ++y) {
        for (int x = 0; x < NX; ++x) {
            const int idx = INDEX(x, y, NX, NY);
            double rho_local = 0.0;
            double ux_local = 0.0;
            double uy_local = 0.0;

            for (int i = 0; i < Q; ++i) {
                const double fi = f[INDEX(x, y, i, NX, NY)];
                rho_local += fi;
                ux_local += fi * cx[i];
                uy_local += fi * cy[i];
            }

            rho_[idx] = rho_local;
            if (rho_local > kDensityFloor) {
                ux_[idx] = ux_local / rho_local;
                uy_[idx] = uy_local / rho_local;
            } else {
                ux_[idx] = 0.0;
                uy_[idx] = 0.0;
            }
        }
    }
}

double LatticeGrid::TotalMass() const {
    double mass = 0.0;
    #pragma omp parallel for reduction(+:mass) schedule(static)
    for (int idx = 0; idx < static_cast<int>(f.size()); ++idx) {
        mass += f[idx];
    }
    return mass;
}
