#include "config.hpp"
#include "errors.hpp"

#include <cmath>
#include <sstream>

namespace {

template <typename T>
[[noreturn]] void Reject(const char* name, const T value, const char* expected) {
    std::ostringstream msg;
    msg << "Invalid " << name << " = " << value << " (expected " << expected << ")";
    throw InvalidInput(msg.str());
}

} // namespace

void Validate(const WindCondition& wind) {
    if (!std::isfinite(wind.speed_ms) || wind.speed_ms < 0.0)
        Reject("wind speed_ms", wind.speed_ms, ">= 0");
    if (!std::isfinite(wind.direction_deg) || wind.direction_deg < 0.0 || wind.direction_deg >= 360.0)
        Reject("wind direction_deg", wind.direction_deg, "in [0, 360)");
}

void Validate(const SimulationParameters& parameters) {
    if (parameters.max_iterations < 1)
        Reject("max_iterations", parameters.max_iterations, ">= 1");
    // BGK is unstable for omega outside (0, 2)
    if (!(parameters.relaxation_rate > 0.0 && parameters.relaxation_rate < 2.0))
        Reject("relaxation_rate", parameters.relaxation_rate, "in (0, 2)");
    if (parameters.buffer_size < 0)
        Reject("buffer_size", parameters.buffer_size, ">= 0");
    if (parameters.vector_stride < 1)
        Reject("vector_stride", parameters.vector_stride, ">= 1");
    if (parameters.output_precision < 0)
        Reject("output_precision", parameters.output_precision, ">= 0");
}

void Validate(const SamplerConfig& sampler) {
    if (sampler.streamline_count < 0)
        Reject("streamline_count", sampler.streamline_count, ">= 0");
    if (!(sampler.streamline_step > 0.0))
        Reject("streamline_step", sampler.streamline_step, "> 0");
    if (sampler.streamline_max_points < 1)
        Reject("streamline_max_points", sampler.streamline_max_points, ">= 1");
    if (sampler.streamline_min_points < 1)
        Reject("streamline_min_points", sampler.streamline_min_points, ">= 1");
    if (sampler.particle_count < 0)
        Reject("particle_count", sampler.particle_count, ">= 0");
    if (!(sampler.particle_dt > 0.0))
        Reject("particle_dt", sampler.particle_dt, "> 0");
    if (!(sampler.particle_noise_std >= 0.0))
        Reject("particle_noise_std", sampler.particle_noise_std, ">= 0");
    if (sampler.particle_max_steps < 1)
        Reject("particle_max_steps", sampler.particle_max_steps, ">= 1");
    if (sampler.particle_min_points < 1)
        Reject("particle_min_points", sampler.particle_min_points, ">= 1");
    if (!(sampler.min_speed >= 0.0))
        Reject("min_speed", sampler.min_speed, ">= 0");
}

void ValidateConfig(const SimulationConfig& config) {
    Validate(config.parameters);
    Validate(config.sampler);
    if (config.n_cores < 1)
        Reject("n_cores", config.n_cores, ">= 1");
}
