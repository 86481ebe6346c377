#pragma once

#include "utils.hpp"

#include <cstddef>
#include <vector>

//--------------------------------------------------------------------------------
// ObstacleMask: solid cells of the domain, row-major (x + NX*y).
// Supplied by the caller and never modified during a run.
//--------------------------------------------------------------------------------
struct ObstacleMask {
    int NX = 0;
    int NY = 0;
    std::vector<bool> solid;

    ObstacleMask() = default;
    ObstacleMask(const int NX, const int NY)
        : NX(NX), NY(NY), solid(static_cast<std::size_t>(NX > 0 ? NX : 0) * (NY > 0 ? NY : 0), false) {}

    bool operator()(const int x, const int y) const { return solid[INDEX(x, y, NX, NY)]; }
    void set(const int x, const int y, const bool value = true) { solid[INDEX(x, y, NX, NY)] = value; }

    // Number of solid cells
    int count() const;
};

//--------------------------------------------------------------------------------
// LatticeGrid: D2Q9 populations + macroscopic moments.
//
// Two population slots: "current" holds the live state, "staging" is scratch
// space written by the streaming step. Swap() hands ownership of the live
// state to the other slot; staging has no defined content afterwards.
//
// Layout: f[i + Q*(x + NX*y)], rho/ux/uy[x + NX*y]
//--------------------------------------------------------------------------------
class LatticeGrid {
public:
    // Throws InvalidInput for NX or NY < 3, ResourceExhaustion when the
    // lattice cannot be allocated.
    LatticeGrid(const int NX, const int NY);

    // Rest state: F_k = 1 everywhere, rho = 9, u = 0
    void Initialize();

    // O(1) exchange of the current and staging slots
    void Swap() { f.swap(f_staging); }

    int nx() const { return NX; }
    int ny() const { return NY; }
    int cells() const { return NX * NY; }

    double& at(const int x, const int y, const int i) { return f[INDEX(x, y, i, NX, NY)]; }
    double at(const int x, const int y, const int i) const { return f[INDEX(x, y, i, NX, NY)]; }

    std::vector<double>& current() { return f; }
    const std::vector<double>& current() const { return f; }
    std::vector<double>& staging() { return f_staging; }

    // Macroscopic fields, read-only outside the grid
    const std::vector<double>& rho() const { return rho_; }
    const std::vector<double>& ux() const { return ux_; }
    const std::vector<double>& uy() const { return uy_; }

    // Imposed velocity at cell idx = x + NX*y (inlet forcing), density untouched
    void ForceVelocity(const int idx, const double u, const double v) {
        ux_[idx] = u;
        uy_[idx] = v;
    }

    // Macroscopic update:  ρ = Σ_i f_i,  ρ u = Σ_i f_i c_i
    // with u = 0 wherever ρ <= kDensityFloor
    void UpdateMacro();

    // Σ_i f_i over the whole grid
    double TotalMass() const;

private:
    const int NX, NY;

    std::vector<double> f;          // current slot
    std::vector<double> f_staging;  // staging slot

    std::vector<double> rho_;
    std::vector<double> ux_;
    std::vector<double> uy_;
};
