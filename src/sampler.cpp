#include "sampler.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <utility>

namespace sampler {

double RoundTo(const double value, const int precision) {
    const double scale = std::pow(10.0, precision);
    const double scaled = value * scale;
    // past the double range there is no digit left to round away
    if (!std::isfinite(scaled)) return value;
    return std::round(scaled) / scale;
}

double Percentile(const std::vector<double>& sorted, const double p) {
    if (sorted.empty()) return 0.0;
    const double rank = p / 100.0 * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(rank));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * (rank - static_cast<double>(lo));
}

std::vector<double> Magnitude(const std::vector<double>& ux, const std::vector<double>& uy) {
    std::vector<double> mag(ux.size());
    #pragma omp parallel for schedule(static)
    for (int idx = 0; idx < static_cast<int>(ux.size()); ++idx) {
        mag[idx] = std::sqrt(ux[idx] * ux[idx] + uy[idx] * uy[idx]);
    }
    return mag;
}

//──────────────────────────────────────────────────────────────────────────────
//  Statistics over the interior: the border next to the inlet and the
//  outflow edges carries boundary artifacts and is left out.
//──────────────────────────────────────────────────────────────────────────────
FlowStatistics ComputeFlowStatistics(const std::vector<double>& ux, const std::vector<double>& uy,
                                     const int NX, const int NY, const int buffer_size,
                                     const bool extended) {
    if (buffer_size < 0 || buffer_size > (std::min(NX, NY) - 1) / 2) {
        throw InvalidInput("Statistics buffer " + std::to_string(buffer_size) +
                           " leaves no interior in a " + std::to_string(NX) + "x" +
                           std::to_string(NY) + " grid");
    }
    const int x_begin = buffer_size, x_end = NX - buffer_size;
    const int y_begin = buffer_size, y_end = NY - buffer_size;

    std::vector<double> core;
    core.reserve(static_cast<size_t>(x_end - x_begin) * (y_end - y_begin));
    for (int y = y_begin; y < y_end; ++y) {
        for (int x = x_begin; x < x_end; ++x) {
            const int idx = INDEX(x, y, NX, NY);
            core.push_back(std::sqrt(ux[idx] * ux[idx] + uy[idx] * uy[idx]));
        }
    }
    std::sort(core.begin(), core.end());

    const double n = static_cast<double>(core.size());
    double sum = 0.0;
    for (double v : core) sum += v;
    const double mean = sum / n;
    double var = 0.0;
    for (double v : core) var += (v - mean) * (v - mean);

    FlowStatistics stats;
    stats.min    = core.front();
    stats.max    = core.back();
    stats.mean   = mean;
    stats.std    = std::sqrt(var / n);
    stats.median = Percentile(core, 50.0);
    stats.p5     = Percentile(core, 5.0);
    stats.p25    = Percentile(core, 25.0);
    stats.p75    = Percentile(core, 75.0);
    stats.p95    = Percentile(core, 95.0);

    if (extended) {
        stats.has_extended = true;
        stats.mean_vorticity = MeanAbsoluteVorticity(ux, uy, NX, NY, buffer_size);
        stats.turbulence_intensity = (stats.mean > 0.0) ? stats.std / stats.mean : 0.0;
    }
    return stats;
}

double MeanAbsoluteVorticity(const std::vector<double>& ux, const std::vector<double>& uy,
                             const int NX, const int NY, const int buffer_size) {
    // central differences need both neighbours
    const int x_begin = std::max(buffer_size, 1), x_end = std::min(NX - buffer_size, NX - 1);
    const int y_begin = std::max(buffer_size, 1), y_end = std::min(NY - buffer_size, NY - 1);
    if (x_begin >= x_end || y_begin >= y_end) return 0.0;

    double sum = 0.0;
    #pragma omp parallel for collapse(2) reduction(+:sum) schedule(static)
    for (int y = y_begin; y < y_end; ++y) {
        for (int x = x_begin; x < x_end; ++x) {
            const double duy_dx = 0.5 * (uy[INDEX(x + 1, y, NX, NY)] - uy[INDEX(x - 1, y, NX, NY)]);
            const double dux_dy = 0.5 * (ux[INDEX(x, y + 1, NX, NY)] - ux[INDEX(x, y - 1, NX, NY)]);
            sum += std::abs(duy_dx - dux_dy);
        }
    }
    return sum / (static_cast<double>(x_end - x_begin) * (y_end - y_begin));
}

std::vector<VectorSample> SampleVectorField(const std::vector<double>& ux, const std::vector<double>& uy,
                                            const ObstacleMask& mask, const int stride,
                                            const int precision) {
    const int NX = mask.NX, NY = mask.NY;
    std::vector<VectorSample> samples;
    for (int y = 0; y < NY; y += stride) {
        for (int x = 0; x < NX; x += stride) {
            if (mask(x, y)) continue;
            const int idx = INDEX(x, y, NX, NY);
            const double mag = std::sqrt(ux[idx] * ux[idx] + uy[idx] * uy[idx]);
            samples.push_back({x, y,
                               RoundTo(ux[idx], precision),
                               RoundTo(uy[idx], precision),
                               RoundTo(mag, precision)});
        }
    }
    return samples;
}

std::vector<double> MagnitudeGrid(const std::vector<double>& ux, const std::vector<double>& uy,
                                  const int precision) {
    std::vector<double> mag = Magnitude(ux, uy);
    for (double& m : mag) m = RoundTo(m, precision);
    return mag;
}

//──────────────────────────────────────────────────────────────────────────────
//  Bilinear interpolation from the 4 cells enclosing (x, y):
//    u = (1-dx)(1-dy) u00 + dx(1-dy) u10 + (1-dx)dy u01 + dx dy u11
//──────────────────────────────────────────────────────────────────────────────
bool Interpolate(const std::vector<double>& ux, const std::vector<double>& uy,
                 const int NX, const int NY, const double x, const double y,
                 VelocitySample& out) {
    if (!(x >= 0.0 && x < NX - 1 && y >= 0.0 && y < NY - 1)) return false;

    const int x0 = static_cast<int>(x);
    const int y0 = static_cast<int>(y);
    const double dx = x - x0;
    const double dy = y - y0;

    const int i00 = INDEX(x0, y0, NX, NY),     i10 = INDEX(x0 + 1, y0, NX, NY);
    const int i01 = INDEX(x0, y0 + 1, NX, NY), i11 = INDEX(x0 + 1, y0 + 1, NX, NY);

    const double w00 = (1.0 - dx) * (1.0 - dy), w10 = dx * (1.0 - dy);
    const double w01 = (1.0 - dx) * dy,         w11 = dx * dy;

    out.ux = w00 * ux[i00] + w10 * ux[i10] + w01 * ux[i01] + w11 * ux[i11];
    out.uy = w00 * uy[i00] + w10 * uy[i10] + w01 * uy[i01] + w11 * uy[i11];
    out.speed = std::sqrt(out.ux * out.ux + out.uy * out.uy);
    return true;
}

// Explicit Euler: x_{n+1} = x_n + u(x_n) * h
Streamline TraceStreamline(const std::vector<double>& ux, const std::vector<double>& uy,
                           const int NX, const int NY, const double x0, const double y0,
                           const SamplerConfig& config) {
    Streamline line;
    double x = x0, y = y0;
    VelocitySample v;
    while (static_cast<int>(line.size()) < config.streamline_max_points) {
        if (!Interpolate(ux, uy, NX, NY, x, y, v)) break;
        if (v.speed < config.min_speed) break;

        line.push_back({x, y, v.speed});
        x += v.ux * config.streamline_step;
        y += v.uy * config.streamline_step;
    }
    return line;
}

std::vector<Streamline> GenerateStreamlines(const std::vector<double>& ux, const std::vector<double>& uy,
                                            const int NX, const int NY, const SamplerConfig& config) {
    // Seeds are drawn up front so the result does not depend on the thread count
    std::mt19937 rng(config.seed);
    std::uniform_real_distribution<double> seed_x(0.0, NX - 1.0);
    std::uniform_real_distribution<double> seed_y(0.0, NY - 1.0);
    std::vector<std::pair<double, double>> seeds(config.streamline_count);
    for (auto& s : seeds) {
        s.first = seed_x(rng);
        s.second = seed_y(rng);
    }

    std::vector<Streamline> traced(seeds.size());
    #pragma omp parallel for schedule(dynamic)
    for (int s = 0; s < static_cast<int>(seeds.size()); ++s) {
        traced[s] = TraceStreamline(ux, uy, NX, NY, seeds[s].first, seeds[s].second, config);
    }

    std::vector<Streamline> lines;
    for (auto& line : traced) {
        if (static_cast<int>(line.size()) >= config.streamline_min_points)
            lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<ParticlePath> GenerateParticles(const std::vector<double>& ux, const std::vector<double>& uy,
                                            const int NX, const int NY, const SamplerConfig& config) {
    std::mt19937 rng(config.seed + 1u);
    std::uniform_real_distribution<double> seed_x(0.0, NX - 1.0);
    std::uniform_real_distribution<double> seed_y(0.0, NY - 1.0);
    std::vector<std::pair<double, double>> seeds(config.particle_count);
    for (auto& s : seeds) {
        s.first = seed_x(rng);
        s.second = seed_y(rng);
    }

    std::vector<ParticlePath> traced(seeds.size());
    #pragma omp parallel for schedule(dynamic)
    for (int p = 0; p < static_cast<int>(seeds.size()); ++p) {
        // one noise stream per particle
        std::seed_seq seq{config.seed, static_cast<std::uint32_t>(p)};
        std::mt19937 noise_rng(seq);
        std::normal_distribution<double> noise(0.0, 1.0);
        const double sigma = config.particle_noise_std;

        ParticlePath& path = traced[p];
        double x = seeds[p].first, y = seeds[p].second;
        VelocitySample v;
        for (int age = 0; age < config.particle_max_steps; ++age) {
            if (!Interpolate(ux, uy, NX, NY, x, y, v)) break;
            if (v.speed < config.min_speed) break;

            const double vx = v.ux + sigma * noise(noise_rng);
            const double vy = v.uy + sigma * noise(noise_rng);
            path.push_back({x, y, vx, vy, std::sqrt(vx * vx + vy * vy), age});

            x += vx * config.particle_dt;
            y += vy * config.particle_dt;
        }
    }

    std::vector<ParticlePath> paths;
    for (auto& path : traced) {
        if (static_cast<int>(path.size()) >= config.particle_min_points)
            paths.push_back(std::move(path));
    }
    return paths;
}

} // namespace sampler
