#include "boundary.hpp"

#include <cmath>
#include <stdexcept>

namespace boundary {

static constexpr double kPi = 3.14159265358979323846;

InletEdge SelectInletEdge(const double direction_deg) {
    if (direction_deg >= 315.0 || direction_deg < 45.0) return InletEdge::North;
    if (direction_deg < 135.0) return InletEdge::East;
    if (direction_deg < 225.0) return InletEdge::South;
    return InletEdge::West;
}

std::pair<double, double> InletVelocity(const double direction_deg) {
    // meteorological bearing -> mathematical angle (x right, y up)
    const double theta = (90.0 - direction_deg) * kPi / 180.0;
    return { kLatticeReferenceSpeed * std::cos(theta),
             kLatticeReferenceSpeed * std::sin(theta) };
}

void ApplyBounceBack(LatticeGrid& lattice, const ObstacleMask& mask) {
    const int NX = lattice.nx();
    const int NY = lattice.ny();
    std::vector<double>& f = lattice.current();

    #pragma omp parallel for collapse(2) schedule(static)
    for (int y = 0; y < NY; ++y) {
        for (int x = 0; x < NX; ++x) {
            if (!mask(x, y)) continue;
            // each pair is visited once, from its lower index
            for (int i = 1; i < Q; ++i) {
                if (opp[i] < i) continue;
                std::swap(f[INDEX(x, y, i, NX, NY)], f[INDEX(x, y, opp[i], NX, NY)]);
            }
        }
    }
}

void ApplyOutflow(LatticeGrid& lattice) {
    const int NX = lattice.nx();
    const int NY = lattice.ny();
    std::vector<double>& f = lattice.current();

    // Top and bottom rows
    #pragma omp parallel for schedule(static)
    for (int x = 0; x < NX; ++x) {
        for (int i = 0; i < Q; ++i) {
            f[INDEX(x, 0, i, NX, NY)]      = f[INDEX(x, 1, i, NX, NY)];
            f[INDEX(x, NY - 1, i, NX, NY)] = f[INDEX(x, NY - 2, i, NX, NY)];
        }
    }
    // Left and right columns (corners take the already corrected rows)
    #pragma omp parallel for schedule(static)
    for (int y = 0; y < NY; ++y) {
        for (int i = 0; i < Q; ++i) {
            f[INDEX(0, y, i, NX, NY)]      = f[INDEX(1, y, i, NX, NY)];
            f[INDEX(NX - 1, y, i, NX, NY)] = f[INDEX(NX - 2, y, i, NX, NY)];
        }
    }
}

void ApplyInflow(LatticeGrid& lattice, const InletEdge edge, const double u0, const double v0) {
    const int NX = lattice.nx();
    const int NY = lattice.ny();

    switch (edge) {
        case InletEdge::North:
            for (int x = 0; x < NX; ++x) lattice.ForceVelocity(INDEX(x, 0, NX, NY), u0, v0);
            break;
        case InletEdge::East:
            for (int y = 0; y < NY; ++y) lattice.ForceVelocity(INDEX(NX - 1, y, NX, NY), u0, v0);
            break;
        case InletEdge::South:
            for (int x = 0; x < NX; ++x) lattice.ForceVelocity(INDEX(x, NY - 1, NX, NY), u0, v0);
            break;
        case InletEdge::West:
            for (int y = 0; y < NY; ++y) lattice.ForceVelocity(INDEX(0, y, NX, NY), u0, v0);
            break;
        default:
            throw std::runtime_error("Inlet edge not supported.");
    }
}

} // namespace boundary
