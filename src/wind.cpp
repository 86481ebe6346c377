#include "wind.hpp"
#include "errors.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iostream>
#include <omp.h>
#include <string>

//──────────────────────────────────────────────────────────────────────────────
//  Constructor
//──────────────────────────────────────────────────────────────────────────────
WindLBM::WindLBM(const ObstacleMask&     _mask,
                 const WindCondition&    _wind,
                 const SimulationConfig& _config)
    : mask_            (ValidateInputs(_mask, _wind, _config)),
      wind_            (_wind),
      NSTEPS           (_config.parameters.max_iterations),
      omega            (_config.parameters.relaxation_rate),
      n_cores          (_config.n_cores),
      track_convergence(_config.features.convergence_tracking),
      inlet_edge_      (boundary::SelectInletEdge(_wind.direction_deg)),
      u0               (boundary::InletVelocity(_wind.direction_deg).first),
      v0               (boundary::InletVelocity(_wind.direction_deg).second),
      lattice_         (_mask.NX, _mask.NY)
{
    if (track_convergence) {
        convergence_history_.assign(NSTEPS, 0.0);
    }
}

//──────────────────────────────────────────────────────────────────────────────
//  Everything is rejected here, before the lattice exists:
//    - grid smaller than 3x3 or mask storage not matching NX*NY
//    - a domain edge without any fluid cell
//    - wind or parameters out of range, statistics border wider than the grid
//──────────────────────────────────────────────────────────────────────────────
const ObstacleMask& WindLBM::ValidateInputs(const ObstacleMask& mask,
                                            const WindCondition& wind,
                                            const SimulationConfig& config) {
    const int NX = mask.NX, NY = mask.NY;
    if (NX < kMinGridSize || NY < kMinGridSize) {
        throw InvalidInput("Obstacle mask " + std::to_string(NX) + "x" + std::to_string(NY) +
                           " too small: NX and NY must be >= " + std::to_string(kMinGridSize));
    }
    if (mask.solid.size() != static_cast<size_t>(NX) * NY) {
        throw InvalidInput("Obstacle mask holds " + std::to_string(mask.solid.size()) +
                           " cells, expected " + std::to_string(NX) + "x" + std::to_string(NY));
    }

    bool open_north = false, open_south = false, open_west = false, open_east = false;
    for (int x = 0; x < NX; ++x) {
        open_north = open_north || !mask(x, 0);
        open_south = open_south || !mask(x, NY - 1);
    }
    for (int y = 0; y < NY; ++y) {
        open_west = open_west || !mask(0, y);
        open_east = open_east || !mask(NX - 1, y);
    }
    if (!open_north) throw InvalidInput("Obstacle mask: top row (North edge) is fully solid");
    if (!open_south) throw InvalidInput("Obstacle mask: bottom row (South edge) is fully solid");
    if (!open_west)  throw InvalidInput("Obstacle mask: left column (West edge) is fully solid");
    if (!open_east)  throw InvalidInput("Obstacle mask: right column (East edge) is fully solid");

    Validate(wind);
    ValidateConfig(config);

    // the statistics need a non-empty interior: 2 * buffer < min(NX, NY), without the product
    const int buffer = config.parameters.buffer_size;
    if (buffer > (std::min(NX, NY) - 1) / 2) {
        throw InvalidInput("buffer_size " + std::to_string(buffer) + " leaves no interior in a " +
                           std::to_string(NX) + "x" + std::to_string(NY) + " grid");
    }
    return mask;
}

//──────────────────────────────────────────────────────────────────────────────
//  One iteration. Every sweep is a parallel loop ending in an implicit
//  barrier, so each one sees the previous sweep complete.
//──────────────────────────────────────────────────────────────────────────────
void WindLBM::Step(const int t) {
    // f(x,y,t+1) = f(x-cx, y-cy, t), periodic wrap
    streaming::StreamPeriodic(lattice_);

    // Solid cells reflect, then the open edges are rewritten
    boundary::ApplyBounceBack(lattice_, mask_);
    boundary::ApplyOutflow(lattice_);

    // ρ = Σ_i f_i,  ρ u = Σ_i f_i c_i
    lattice_.UpdateMacro();

    // Inlet velocity enters through the equilibrium of the next collision
    boundary::ApplyInflow(lattice_, inlet_edge_, u0, v0);

    if (track_convergence && t % kConvergenceInterval == 0) {
        convergence_history_[t] = MeanSquaredVelocity();
    }

    // f += ω (f_eq - f)
    collisions::CollideBGK(lattice_, omega);
}

VelocityField WindLBM::Run_simulation() {

    // Set threads for this simulation
    omp_set_num_threads(static_cast<int>(n_cores));

    lattice_.Initialize();
    if (track_convergence) {
        std::fill(convergence_history_.begin(), convergence_history_.end(), 0.0);
    }

    const int report_every = NSTEPS >= 10 ? NSTEPS / 10 : 1;

    //──────────────────────────────────────────────────────────────────────────────
    //  Main loop: for t = 0 … NSTEPS−1. No early exit, convergence is only
    //  observed.
    //──────────────────────────────────────────────────────────────────────────────
    for (int t = 0; t < NSTEPS; ++t) {
        Step(t);

        if ((t + 1) % report_every == 0) {
            std::cout << "  iteration " << (t + 1) << "/" << NSTEPS
                      << " (" << (100 * (t + 1)) / NSTEPS << "%)" << std::endl;
        }
    }

    return ScaledVelocity();
}

//──────────────────────────────────────────────────────────────────────────────
//  Lattice -> physical units:  u_phys = u_latt * (speed / 0.1)
//──────────────────────────────────────────────────────────────────────────────
VelocityField WindLBM::ScaledVelocity() const {
    const int NX = lattice_.nx();
    const int NY = lattice_.ny();
    const double factor = scale();
    const std::vector<double>& ux = lattice_.ux();
    const std::vector<double>& uy = lattice_.uy();

    VelocityField field;
    field.NX = NX;
    field.NY = NY;
    field.ux.resize(ux.size());
    field.uy.resize(uy.size());

    #pragma omp parallel for schedule(static)
    for (int idx = 0; idx < NX * NY; ++idx) {
        field.ux[idx] = ux[idx] * factor;
        field.uy[idx] = uy[idx] * factor;
    }
    return field;
}

double WindLBM::MeanSquaredVelocity() const {
    const std::vector<double>& ux = lattice_.ux();
    const std::vector<double>& uy = lattice_.uy();
    const int size = lattice_.cells();

    double sum = 0.0;
    #pragma omp parallel for reduction(+:sum) schedule(static)
    for (int idx = 0; idx < size; ++idx) {
        sum += ux[idx] * ux[idx] + uy[idx] * uy[idx];
    }
    return sum / size;
}

// Wall-clock start of the run, e.g. 2024-05-01T14:03:59
static std::string LocalTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
    return buffer;
}

//──────────────────────────────────────────────────────────────────────────────
//  Full pipeline: solver, then the samplers on the finished field
//──────────────────────────────────────────────────────────────────────────────
WindResult RunWindSimulation(const ObstacleMask& mask,
                             const WindCondition& wind,
                             const SimulationConfig& config) {
    const SimulationParameters& params = config.parameters;
    const FeatureFlags& features = config.features;

    WindLBM lb(mask, wind, config);

    std::cout << "Wind LBM: grid " << mask.NX << "x" << mask.NY
              << ", wind " << wind.speed_ms << " m/s from " << wind.direction_deg << " deg"
              << ", " << params.max_iterations << " iterations, omega " << params.relaxation_rate
              << ", " << config.n_cores << " threads" << std::endl;

    WindResult result;
    result.timestamp = LocalTimestamp();
    result.wind = wind;
    result.parameters = params;
    result.n_cores = config.n_cores;

    // Define clock to evaluate time intervals
    const auto start_time = std::chrono::steady_clock::now();

    result.velocity = lb.Run_simulation();

    const auto end_time = std::chrono::steady_clock::now();
    result.computation_time = std::chrono::duration<double>(end_time - start_time).count();
    std::cout << "Simulation ended in " << result.computation_time << " s" << std::endl;

    const int NX = mask.NX, NY = mask.NY;
    const std::vector<double>& ux = result.velocity.ux;
    const std::vector<double>& uy = result.velocity.uy;

    result.width = NX;
    result.height = NY;
    result.obstacle_count = mask.count();

    result.flow_statistics = sampler::ComputeFlowStatistics(ux, uy, NX, NY, params.buffer_size,
                                                            features.extended_statistics);
    result.vector_field = sampler::SampleVectorField(ux, uy, mask, params.vector_stride,
                                                     params.output_precision);
    result.magnitude_grid = sampler::MagnitudeGrid(ux, uy, params.output_precision);

    if (features.streamlines) {
        result.streamlines = sampler::GenerateStreamlines(ux, uy, NX, NY, config.sampler);
        std::cout << "Streamlines: " << result.streamlines.size() << " kept of "
                  << config.sampler.streamline_count << " seeds" << std::endl;
    }
    if (features.particles) {
        result.particles = sampler::GenerateParticles(ux, uy, NX, NY, config.sampler);
        std::cout << "Particles: " << result.particles.size() << " kept of "
                  << config.sampler.particle_count << " seeds" << std::endl;
    }
    if (features.convergence_tracking) {
        result.convergence_history = lb.convergence_history();
    }

    return result;
}
