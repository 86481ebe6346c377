#pragma once

#include "boundary.hpp"
#include "collisions.hpp"
#include "config.hpp"
#include "lattice.hpp"
#include "sampler.hpp"
#include "streaming.hpp"
#include "utils.hpp"

#include <cstddef>
#include <string>
#include <vector>

//--------------------------------------------------------------------------------
// Velocity field in physical units [m/s], layout x + NX*y
//--------------------------------------------------------------------------------
struct VelocityField {
    int NX = 0, NY = 0;
    std::vector<double> ux;
    std::vector<double> uy;
};

//--------------------------------------------------------------------------------
// WindLBM: steady 2-D wind flow around obstacles, D2Q9 BGK.
// Inputs are validated in the constructor, before the lattice is allocated.
// Run_simulation() then executes exactly max_iterations steps:
//
//   Streaming -> Bounce-back -> Outflow -> Macro update -> Inflow -> Collision
//
// and scales the lattice velocity by speed / 0.1 at the end.
//--------------------------------------------------------------------------------
class WindLBM {
public:
    // Throws InvalidInput on bad mask, wind or parameters,
    // ResourceExhaustion when the lattice does not fit in memory.
    WindLBM(const ObstacleMask& mask,
            const WindCondition& wind,
            const SimulationConfig& config);

    // One full iteration t (0-based)
    void Step(const int t);

    // Complete run from the rest state, returns the physical velocity
    VelocityField Run_simulation();

    // Lattice velocity -> physical velocity
    VelocityField ScaledVelocity() const;

    const LatticeGrid& lattice() const { return lattice_; }
    LatticeGrid& lattice() { return lattice_; }

    // Mean u² (lattice units) every 10th iteration, zero elsewhere.
    // Empty unless convergence tracking is enabled.
    const std::vector<double>& convergence_history() const { return convergence_history_; }

    boundary::InletEdge inlet_edge() const { return inlet_edge_; }
    double scale() const { return wind_.speed_ms / kLatticeReferenceSpeed; }

    static constexpr int kConvergenceInterval = 10;

private:
    //──────────────────────────────────────────────────────────────────────────────
    // Inputs
    //──────────────────────────────────────────────────────────────────────────────
    const ObstacleMask   mask_;
    const WindCondition  wind_;
    const int            NSTEPS;
    const double         omega;
    const std::size_t    n_cores;
    const bool           track_convergence;

    //──────────────────────────────────────────────────────────────────────────────
    // Inlet, lattice units
    //──────────────────────────────────────────────────────────────────────────────
    boundary::InletEdge inlet_edge_;
    double u0, v0;

    LatticeGrid lattice_;
    std::vector<double> convergence_history_;

    // Mean u² over the grid after the inflow forcing
    double MeanSquaredVelocity() const;

    // Checks mask, wind and config, returns the mask so it can seed mask_
    static const ObstacleMask& ValidateInputs(const ObstacleMask& mask,
                                              const WindCondition& wind,
                                              const SimulationConfig& config);
};

//--------------------------------------------------------------------------------
// Everything produced by one run
//--------------------------------------------------------------------------------
struct WindResult {
    int width = 0, height = 0, obstacle_count = 0;
    double computation_time = 0.0;                       // [s]

    // Run echo: local start time (ISO 8601), inputs and solver settings
    std::string timestamp;
    WindCondition wind;
    SimulationParameters parameters;
    std::size_t n_cores = 1;

    VelocityField velocity;                              // unrounded
    sampler::FlowStatistics flow_statistics;
    std::vector<sampler::VectorSample> vector_field;
    std::vector<double> magnitude_grid;                  // rounded, x + NX*y

    std::vector<sampler::Streamline> streamlines;        // if enabled
    std::vector<sampler::ParticlePath> particles;        // if enabled
    std::vector<double> convergence_history;             // if enabled
};

// Solver + sampling, timed
WindResult RunWindSimulation(const ObstacleMask& mask,
                             const WindCondition& wind,
                             const SimulationConfig& config);
