#pragma once

#include <cstddef>
#include <cstdint>

//──────────────────────────────────────────────────────────────────────────────
//  Run configuration. Everything the driver needs is passed in explicitly at
//  construction, there is no process-wide default state.
//──────────────────────────────────────────────────────────────────────────────

// Ambient wind, meteorological convention:
// 0° = from North, clockwise, direction the wind blows FROM.
struct WindCondition {
    double speed_ms      = 0.0;   // [m/s], >= 0
    double direction_deg = 0.0;   // [deg], in [0, 360)
};

struct SimulationParameters {
    int    max_iterations   = 4000;
    double relaxation_rate  = 1.4;  // BGK omega, in (0, 2)
    int    buffer_size      = 10;   // border excluded from the statistics
    int    vector_stride    = 5;    // every n-th row/column in the vector field
    int    output_precision = 4;    // decimals kept in the sampled output
};

// Optional stages. None of them feeds back into the solver loop.
struct FeatureFlags {
    bool streamlines          = false;
    bool particles            = false;
    bool convergence_tracking = false;
    bool extended_statistics  = false;  // vorticity + turbulence intensity

    static FeatureFlags Basic() { return FeatureFlags{}; }
    static FeatureFlags Enhanced() { return FeatureFlags{true, true, true, true}; }
};

struct SamplerConfig {
    // Streamlines (explicit Euler)
    int    streamline_count      = 100;
    double streamline_step       = 0.5;   // [cells per unit speed]
    int    streamline_max_points = 200;
    int    streamline_min_points = 5;

    // Particles (Euler + Gaussian velocity noise)
    int    particle_count     = 200;
    double particle_dt        = 0.5;
    double particle_noise_std = 0.05;     // [m/s]
    int    particle_max_steps = 100;
    int    particle_min_points = 3;

    double min_speed = 0.01;              // tracing stops below this [m/s]
    std::uint32_t seed = 42;
};

struct SimulationConfig {
    SimulationParameters parameters;
    FeatureFlags         features;
    SamplerConfig        sampler;
    std::size_t          n_cores = 1;     // OpenMP threads
};

// Range checks, throw InvalidInput naming the offending value
void Validate(const WindCondition& wind);
void Validate(const SimulationParameters& parameters);
void Validate(const SamplerConfig& sampler);
void ValidateConfig(const SimulationConfig& config);
