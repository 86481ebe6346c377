#pragma once

#include "config.hpp"
#include "lattice.hpp"

#include <vector>

namespace sampler {

//--------------------------------------------------------------------------------
// Output records
//--------------------------------------------------------------------------------
struct FlowStatistics {
    double min = 0.0, max = 0.0, mean = 0.0, std = 0.0, median = 0.0;
    double p5 = 0.0, p25 = 0.0, p75 = 0.0, p95 = 0.0;

    // Only filled when extended statistics are requested
    bool   has_extended = false;
    double mean_vorticity = 0.0;
    double turbulence_intensity = 0.0;
};

struct VectorSample {
    int x, y;
    double vx, vy, magnitude;
};

struct StreamlinePoint {
    double x, y, speed;
};
using Streamline = std::vector<StreamlinePoint>;

struct ParticlePoint {
    double x, y, vx, vy, speed;
    int age;
};
using ParticlePath = std::vector<ParticlePoint>;

struct VelocitySample {
    double ux, uy, speed;
};

//---------------------------------------------------------------------------
// Helpers
//---------------------------------------------------------------------------

// Round half away from zero to a fixed number of decimals
double RoundTo(const double value, const int precision);

// Linear interpolation between closest ranks, p in [0, 100], data sorted ascending
double Percentile(const std::vector<double>& sorted, const double p);

// |u| for every cell
std::vector<double> Magnitude(const std::vector<double>& ux, const std::vector<double>& uy);

//---------------------------------------------------------------------------
// Statistics and samples of a finished field
//---------------------------------------------------------------------------

// Statistics of |u| over rows [b, NY-b) and columns [b, NX-b).
// Throws InvalidInput when the border leaves no interior.
FlowStatistics ComputeFlowStatistics(const std::vector<double>& ux, const std::vector<double>& uy,
                                     const int NX, const int NY, const int buffer_size,
                                     const bool extended);

// Mean |∂uy/∂x − ∂ux/∂y| (central differences) over the same interior.
double MeanAbsoluteVorticity(const std::vector<double>& ux, const std::vector<double>& uy,
                             const int NX, const int NY, const int buffer_size);

// Every stride-th row and column, solid cells skipped, values rounded
std::vector<VectorSample> SampleVectorField(const std::vector<double>& ux, const std::vector<double>& uy,
                                            const ObstacleMask& mask, const int stride,
                                            const int precision);

// |u| for every cell, rounded
std::vector<double> MagnitudeGrid(const std::vector<double>& ux, const std::vector<double>& uy,
                                  const int precision);

//---------------------------------------------------------------------------
// Tracing
//---------------------------------------------------------------------------

// Bilinear interpolation inside [0, NX-1) x [0, NY-1). Returns false outside.
bool Interpolate(const std::vector<double>& ux, const std::vector<double>& uy,
                 const int NX, const int NY, const double x, const double y,
                 VelocitySample& out);

// One streamline from (x0, y0), single explicit Euler stage per step
Streamline TraceStreamline(const std::vector<double>& ux, const std::vector<double>& uy,
                           const int NX, const int NY, const double x0, const double y0,
                           const SamplerConfig& config);

// Seeds streamline_count random points; lines shorter than streamline_min_points are dropped
std::vector<Streamline> GenerateStreamlines(const std::vector<double>& ux, const std::vector<double>& uy,
                                            const int NX, const int NY, const SamplerConfig& config);

// Seeds particle_count random particles with Gaussian velocity noise;
// paths shorter than particle_min_points are dropped
std::vector<ParticlePath> GenerateParticles(const std::vector<double>& ux, const std::vector<double>& uy,
                                            const int NX, const int NY, const SamplerConfig& config);

} // namespace sampler
