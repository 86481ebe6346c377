#include "errors.hpp"
#include "sampler.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace sampler;

namespace {

// ux(x, y) and uy(x, y) filled from callables, layout x + NX*y
template <typename FX, typename FY>
void Fill(const int NX, const int NY, FX fx, FY fy,
          std::vector<double>& ux, std::vector<double>& uy) {
    ux.assign(NX * NY, 0.0);
    uy.assign(NX * NY, 0.0);
    for (int y = 0; y < NY; ++y)
        for (int x = 0; x < NX; ++x) {
            ux[INDEX(x, y, NX, NY)] = fx(x, y);
            uy[INDEX(x, y, NX, NY)] = fy(x, y);
        }
}

} // namespace

TEST(RoundTo, HalfAwayFromZero) {
    EXPECT_DOUBLE_EQ(RoundTo(1.23456, 2), 1.23);
    EXPECT_DOUBLE_EQ(RoundTo(2.5, 0), 3.0);
    EXPECT_DOUBLE_EQ(RoundTo(-2.5, 0), -3.0);
    EXPECT_DOUBLE_EQ(RoundTo(0.125, 2), 0.13);
    EXPECT_DOUBLE_EQ(RoundTo(7.0, 4), 7.0);
}

TEST(RoundTo, PrecisionBeyondDoubleRangeKeepsValue) {
    EXPECT_DOUBLE_EQ(RoundTo(1.5, 309), 1.5);
    EXPECT_DOUBLE_EQ(RoundTo(-2.25, 400), -2.25);
    EXPECT_NEAR(RoundTo(0.125, 300), 0.125, 1e-15);

    const std::vector<double> mag = MagnitudeGrid({3.0, 0.0}, {4.0, 0.0}, 400);
    ASSERT_EQ(mag.size(), 2u);
    EXPECT_DOUBLE_EQ(mag[0], 5.0);
    EXPECT_DOUBLE_EQ(mag[1], 0.0);
}

TEST(Percentile, LinearBetweenClosestRanks) {
    const std::vector<double> data = {1.0, 2.0, 3.0, 4.0, 5.0};
    EXPECT_DOUBLE_EQ(Percentile(data, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(Percentile(data, 50.0), 3.0);
    EXPECT_DOUBLE_EQ(Percentile(data, 25.0), 2.0);
    EXPECT_NEAR(Percentile(data, 5.0), 1.2, 1e-12);
    EXPECT_NEAR(Percentile(data, 95.0), 4.8, 1e-12);
    EXPECT_DOUBLE_EQ(Percentile(data, 100.0), 5.0);
    EXPECT_DOUBLE_EQ(Percentile({4.0}, 75.0), 4.0);
}

TEST(ComputeFlowStatistics, InteriorOnly) {
    // |u| = x, the border (width 1) holds a large spike that must be ignored
    std::vector<double> ux, uy;
    Fill(5, 5, [](int x, int y) { return (x == 0 || y == 0) ? 100.0 : static_cast<double>(x); },
         [](int, int) { return 0.0; }, ux, uy);

    const FlowStatistics s = ComputeFlowStatistics(ux, uy, 5, 5, 1, false);

    // interior magnitudes: {1, 2, 3} on each of three rows
    EXPECT_DOUBLE_EQ(s.min, 1.0);
    EXPECT_DOUBLE_EQ(s.max, 3.0);
    EXPECT_DOUBLE_EQ(s.mean, 2.0);
    EXPECT_NEAR(s.std, std::sqrt(2.0 / 3.0), 1e-12);
    EXPECT_DOUBLE_EQ(s.median, 2.0);
    EXPECT_DOUBLE_EQ(s.p5, 1.0);
    EXPECT_DOUBLE_EQ(s.p25, 1.0);
    EXPECT_DOUBLE_EQ(s.p75, 3.0);
    EXPECT_DOUBLE_EQ(s.p95, 3.0);
    EXPECT_FALSE(s.has_extended);
}

TEST(ComputeFlowStatistics, ExtendedAddsTurbulenceIntensity) {
    std::vector<double> ux, uy;
    Fill(5, 5, [](int x, int) { return static_cast<double>(x); }, [](int, int) { return 0.0; }, ux, uy);

    const FlowStatistics s = ComputeFlowStatistics(ux, uy, 5, 5, 1, true);

    EXPECT_TRUE(s.has_extended);
    EXPECT_NEAR(s.turbulence_intensity, std::sqrt(2.0 / 3.0) / 2.0, 1e-12);
    EXPECT_NEAR(s.mean_vorticity, 0.0, 1e-12);   // pure shear-free field
}

TEST(ComputeFlowStatistics, StillAirHasZeroTurbulenceIntensity) {
    const std::vector<double> zero(36, 0.0);
    const FlowStatistics s = ComputeFlowStatistics(zero, zero, 6, 6, 1, true);
    EXPECT_DOUBLE_EQ(s.mean, 0.0);
    EXPECT_DOUBLE_EQ(s.turbulence_intensity, 0.0);
}

TEST(ComputeFlowStatistics, RejectsBufferWithoutInterior) {
    const std::vector<double> zero(36, 0.0);
    EXPECT_THROW(ComputeFlowStatistics(zero, zero, 6, 6, 3, false), InvalidInput);
    EXPECT_THROW(ComputeFlowStatistics(zero, zero, 6, 6, -1, false), InvalidInput);
    EXPECT_THROW(ComputeFlowStatistics(zero, zero, 6, 6, 2000000000, false), InvalidInput);
    EXPECT_NO_THROW(ComputeFlowStatistics(zero, zero, 6, 6, 2, false));
}

TEST(MeanAbsoluteVorticity, SolidBodyRotation) {
    // u = (-(y-c), x-c) has curl 2 everywhere
    std::vector<double> ux, uy;
    Fill(7, 7, [](int, int y) { return -(y - 3.0); }, [](int x, int) { return x - 3.0; }, ux, uy);
    EXPECT_NEAR(MeanAbsoluteVorticity(ux, uy, 7, 7, 1), 2.0, 1e-12);
}

TEST(SampleVectorField, StrideAndObstaclesRespected) {
    std::vector<double> ux, uy;
    Fill(10, 10, [](int, int) { return 1.23456; }, [](int, int) { return -0.5; }, ux, uy);
    ObstacleMask mask(10, 10);
    mask.set(5, 5);

    const std::vector<VectorSample> samples = SampleVectorField(ux, uy, mask, 5, 2);

    ASSERT_EQ(samples.size(), 3u);
    for (const auto& v : samples) {
        EXPECT_FALSE(v.x == 5 && v.y == 5);
        EXPECT_DOUBLE_EQ(v.vx, 1.23);
        EXPECT_DOUBLE_EQ(v.vy, -0.5);
        EXPECT_DOUBLE_EQ(v.magnitude, RoundTo(std::hypot(1.23456, 0.5), 2));
    }
}

TEST(MagnitudeGrid, RoundedSpeedPerCell) {
    const std::vector<double> ux = {3.0, 0.0, 1.0};
    const std::vector<double> uy = {4.0, 0.0, 1.0};
    const std::vector<double> mag = MagnitudeGrid(ux, uy, 3);
    ASSERT_EQ(mag.size(), 3u);
    EXPECT_DOUBLE_EQ(mag[0], 5.0);
    EXPECT_DOUBLE_EQ(mag[1], 0.0);
    EXPECT_DOUBLE_EQ(mag[2], 1.414);
}

TEST(Interpolate, ExactForLinearFields) {
    std::vector<double> ux, uy;
    Fill(6, 6, [](int x, int y) { return x + 10.0 * y; }, [](int x, int) { return 2.0 * x; }, ux, uy);

    VelocitySample v;
    ASSERT_TRUE(Interpolate(ux, uy, 6, 6, 1.25, 2.5, v));
    EXPECT_NEAR(v.ux, 26.25, 1e-12);
    EXPECT_NEAR(v.uy, 2.5, 1e-12);
    EXPECT_NEAR(v.speed, std::hypot(26.25, 2.5), 1e-12);
}

TEST(Interpolate, OutsideDomainIsRejected) {
    const std::vector<double> zero(36, 0.0);
    VelocitySample v;
    EXPECT_FALSE(Interpolate(zero, zero, 6, 6, -0.1, 2.0, v));
    EXPECT_FALSE(Interpolate(zero, zero, 6, 6, 5.0, 2.0, v));
    EXPECT_FALSE(Interpolate(zero, zero, 6, 6, 2.0, 5.0, v));
    EXPECT_TRUE(Interpolate(zero, zero, 6, 6, 4.99, 0.0, v));
}

TEST(TraceStreamline, EulerStepsInUniformFlow) {
    std::vector<double> ux, uy;
    Fill(20, 5, [](int, int) { return 1.0; }, [](int, int) { return 0.0; }, ux, uy);
    const SamplerConfig config;

    const Streamline line = TraceStreamline(ux, uy, 20, 5, 0.0, 2.0, config);

    // x = 0, 0.5, ..., 18.5 stays inside [0, 19)
    ASSERT_EQ(line.size(), 38u);
    for (size_t k = 0; k < line.size(); ++k) {
        EXPECT_DOUBLE_EQ(line[k].x, 0.5 * k);
        EXPECT_DOUBLE_EQ(line[k].y, 2.0);
        EXPECT_DOUBLE_EQ(line[k].speed, 1.0);
    }
}

TEST(TraceStreamline, StopsAtMaxPointsAndLowSpeed) {
    std::vector<double> ux, uy;
    Fill(20, 5, [](int, int) { return 1.0; }, [](int, int) { return 0.0; }, ux, uy);
    SamplerConfig config;
    config.streamline_max_points = 10;
    EXPECT_EQ(TraceStreamline(ux, uy, 20, 5, 0.0, 2.0, config).size(), 10u);

    const std::vector<double> still(100, 0.0);
    EXPECT_TRUE(TraceStreamline(still, still, 20, 5, 0.0, 2.0, config).empty());
}

TEST(GenerateStreamlines, ShortLinesDroppedAndReproducible) {
    std::vector<double> ux, uy;
    Fill(20, 20, [](int, int) { return 1.0; }, [](int, int) { return 0.0; }, ux, uy);
    SamplerConfig config;
    config.streamline_count = 50;

    const std::vector<Streamline> a = GenerateStreamlines(ux, uy, 20, 20, config);
    const std::vector<Streamline> b = GenerateStreamlines(ux, uy, 20, 20, config);

    EXPECT_LE(a.size(), 50u);
    EXPECT_FALSE(a.empty());
    for (const auto& line : a) EXPECT_GE(static_cast<int>(line.size()), config.streamline_min_points);

    ASSERT_EQ(a.size(), b.size());
    for (size_t l = 0; l < a.size(); ++l) {
        ASSERT_EQ(a[l].size(), b[l].size());
        EXPECT_DOUBLE_EQ(a[l].front().x, b[l].front().x);
        EXPECT_DOUBLE_EQ(a[l].front().y, b[l].front().y);
    }
}

TEST(GenerateStreamlines, StillAirGivesNoLines) {
    const std::vector<double> still(400, 0.0);
    EXPECT_TRUE(GenerateStreamlines(still, still, 20, 20, SamplerConfig{}).empty());
}

TEST(GenerateParticles, NoiselessParticlesFollowTheFlow) {
    std::vector<double> ux, uy;
    Fill(30, 10, [](int, int) { return 1.0; }, [](int, int) { return 0.0; }, ux, uy);
    SamplerConfig config;
    config.particle_count = 20;
    config.particle_noise_std = 0.0;

    const std::vector<ParticlePath> paths = GenerateParticles(ux, uy, 30, 10, config);

    EXPECT_FALSE(paths.empty());
    for (const auto& path : paths) {
        ASSERT_GE(static_cast<int>(path.size()), config.particle_min_points);
        EXPECT_LE(static_cast<int>(path.size()), config.particle_max_steps);
        for (size_t k = 0; k < path.size(); ++k) {
            EXPECT_EQ(path[k].age, static_cast<int>(k));
            EXPECT_DOUBLE_EQ(path[k].vx, 1.0);
            EXPECT_DOUBLE_EQ(path[k].vy, 0.0);
            if (k > 0) EXPECT_NEAR(path[k].x - path[k - 1].x, 0.5, 1e-12);
        }
    }
}

TEST(GenerateParticles, NoisyPathsAreReproducible) {
    std::vector<double> ux, uy;
    Fill(30, 10, [](int, int) { return 1.0; }, [](int, int) { return 0.2; }, ux, uy);
    SamplerConfig config;
    config.particle_count = 25;

    const std::vector<ParticlePath> a = GenerateParticles(ux, uy, 30, 10, config);
    const std::vector<ParticlePath> b = GenerateParticles(ux, uy, 30, 10, config);

    ASSERT_EQ(a.size(), b.size());
    for (size_t n = 0; n < a.size(); ++n) {
        ASSERT_EQ(a[n].size(), b[n].size());
        for (size_t k = 0; k < a[n].size(); ++k) {
            EXPECT_DOUBLE_EQ(a[n][k].x, b[n][k].x);
            EXPECT_DOUBLE_EQ(a[n][k].vy, b[n][k].vy);
        }
    }
}
