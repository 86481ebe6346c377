#include "output.hpp"
#include "errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace output {

ObstacleMask LoadObstacleMask(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InvalidInput("Unable to open obstacle mask file: " + path);
    }

    std::vector<std::string> rows;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (!rows.empty() && line.size() != rows.front().size()) {
            throw InvalidInput("Obstacle mask " + path + ": row " + std::to_string(rows.size()) +
                               " has " + std::to_string(line.size()) + " cells, expected " +
                               std::to_string(rows.front().size()));
        }
        rows.push_back(line);
    }
    if (rows.empty()) {
        throw InvalidInput("Obstacle mask " + path + " is empty");
    }

    const int NX = static_cast<int>(rows.front().size());
    const int NY = static_cast<int>(rows.size());
    ObstacleMask mask(NX, NY);
    for (int y = 0; y < NY; ++y) {
        for (int x = 0; x < NX; ++x) {
            const char c = rows[y][x];
            if (c == '1' || c == '#') {
                mask.set(x, y);
            } else if (c != '0' && c != '.') {
                throw InvalidInput("Obstacle mask " + path + ": unexpected character '" +
                                   std::string(1, c) + "' at row " + std::to_string(y) +
                                   ", column " + std::to_string(x));
            }
        }
    }
    return mask;
}

ObstacleMask DefaultScene(const int NX, const int NY) {
    ObstacleMask mask(NX, NY);
    // {x0, y0, width, height} as fractions of the domain
    const double blocks[3][4] = {
        {0.30, 0.25, 0.08, 0.20},
        {0.45, 0.55, 0.12, 0.10},
        {0.65, 0.30, 0.06, 0.35}
    };
    for (const auto& b : blocks) {
        const int x0 = static_cast<int>(b[0] * NX), y0 = static_cast<int>(b[1] * NY);
        const int x1 = x0 + std::max(1, static_cast<int>(b[2] * NX));
        const int y1 = y0 + std::max(1, static_cast<int>(b[3] * NY));
        for (int y = y0; y < std::min(y1, NY - 1); ++y)
            for (int x = x0; x < std::min(x1, NX - 1); ++x)
                mask.set(x, y);
    }
    return mask;
}

//──────────────────────────────────────────────────────────────────────────────
//  CSV writers
//──────────────────────────────────────────────────────────────────────────────
static std::ofstream OpenCsv(const std::string& path, const int precision) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open the output file: " + path);
    }
    file << std::fixed << std::setprecision(precision);
    return file;
}

void WriteFlowStatistics(const std::string& path, const WindResult& result, const int precision) {
    std::ofstream file = OpenCsv(path, precision);
    const sampler::FlowStatistics& s = result.flow_statistics;

    file << "statistic,value\n";
    file << "min," << s.min << "\n"
         << "max," << s.max << "\n"
         << "mean," << s.mean << "\n"
         << "std," << s.std << "\n"
         << "median," << s.median << "\n"
         << "p5," << s.p5 << "\n"
         << "p25," << s.p25 << "\n"
         << "p75," << s.p75 << "\n"
         << "p95," << s.p95 << "\n";
    if (s.has_extended) {
        file << "mean_vorticity," << s.mean_vorticity << "\n"
             << "turbulence_intensity," << s.turbulence_intensity << "\n";
    }
    file << "computation_time," << result.computation_time << "\n";
    file << "grid_width," << result.width << "\n"
         << "grid_height," << result.height << "\n"
         << "obstacle_count," << result.obstacle_count << "\n";
}

void WriteVectorField(const std::string& path, const WindResult& result, const int precision) {
    std::ofstream file = OpenCsv(path, precision);
    file << "x,y,vx,vy,magnitude\n";
    for (const auto& v : result.vector_field) {
        file << v.x << "," << v.y << "," << v.vx << "," << v.vy << "," << v.magnitude << "\n";
    }
}

void WriteMagnitudeGrid(const std::string& path, const WindResult& result, const int precision) {
    std::ofstream file = OpenCsv(path, precision);
    const int NX = result.width, NY = result.height;
    for (int y = 0; y < NY; ++y) {
        for (int x = 0; x < NX; ++x) {
            if (x > 0) file << ",";
            file << result.magnitude_grid[INDEX(x, y, NX, NY)];
        }
        file << "\n";
    }
}

void WriteStreamlines(const std::string& path, const WindResult& result, const int precision) {
    std::ofstream file = OpenCsv(path, precision);
    file << "line,point,x,y,speed\n";
    for (size_t l = 0; l < result.streamlines.size(); ++l) {
        const auto& line = result.streamlines[l];
        for (size_t p = 0; p < line.size(); ++p) {
            file << l << "," << p << "," << line[p].x << "," << line[p].y << "," << line[p].speed << "\n";
        }
    }
}

void WriteParticles(const std::string& path, const WindResult& result, const int precision) {
    std::ofstream file = OpenCsv(path, precision);
    file << "particle,x,y,vx,vy,speed,age\n";
    for (size_t n = 0; n < result.particles.size(); ++n) {
        for (const auto& p : result.particles[n]) {
            file << n << "," << p.x << "," << p.y << "," << p.vx << "," << p.vy << ","
                 << p.speed << "," << p.age << "\n";
        }
    }
}

void WriteConvergenceHistory(const std::string& path, const WindResult& result) {
    std::ofstream file = OpenCsv(path, 10);
    file << std::scientific;
    file << "iteration,mean_u2\n";
    for (size_t t = 0; t < result.convergence_history.size(); ++t) {
        file << t << "," << result.convergence_history[t] << "\n";
    }
}

void WriteRunMetadata(const std::string& path, const WindResult& result) {
    std::ofstream file = OpenCsv(path, 0);
    file << std::defaultfloat << std::setprecision(10);
    const SimulationParameters& p = result.parameters;

    file << "key,value\n";
    file << "timestamp," << result.timestamp << "\n"
         << "wind_speed_ms," << result.wind.speed_ms << "\n"
         << "wind_direction_deg," << result.wind.direction_deg << "\n"
         << "max_iterations," << p.max_iterations << "\n"
         << "relaxation_rate," << p.relaxation_rate << "\n"
         << "buffer_size," << p.buffer_size << "\n"
         << "vector_stride," << p.vector_stride << "\n"
         << "output_precision," << p.output_precision << "\n"
         << "n_cores," << result.n_cores << "\n";
}

void ExportResults(const std::string& output_dir, const WindResult& result,
                   const SimulationConfig& config) {
    std::filesystem::create_directories(output_dir);
    const std::filesystem::path dir(output_dir);
    const int precision = config.parameters.output_precision;

    WriteFlowStatistics((dir / "flow_statistics.csv").string(), result, precision);
    WriteVectorField((dir / "vector_field.csv").string(), result, precision);
    WriteMagnitudeGrid((dir / "magnitude_grid.csv").string(), result, precision);
    WriteRunMetadata((dir / "run_metadata.csv").string(), result);
    if (config.features.streamlines)
        WriteStreamlines((dir / "streamlines.csv").string(), result, precision);
    if (config.features.particles)
        WriteParticles((dir / "particles.csv").string(), result, precision);
    if (config.features.convergence_tracking)
        WriteConvergenceHistory((dir / "convergence_history.csv").string(), result);

    std::cout << "Results written to " << output_dir << std::endl;
}

void AppendRunLog(const std::string& path, const WindResult& result,
                  const WindCondition& wind, const SimulationConfig& config) {
    const std::filesystem::path log_path(path);
    if (log_path.has_parent_path()) std::filesystem::create_directories(log_path.parent_path());

    std::ofstream file(path, std::ios::app); //Append mode
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open the output file: " + path);
    }

    // Write header if file is empty
    if (file.tellp() == 0) {
        file << "Grid_Dimension,Number_of_Steps,Number_of_Cores,Omega,Wind_Speed,Wind_Direction,Total_Computation_Time(s)\n";
    }

    file << result.width << "x" << result.height << "," << config.parameters.max_iterations << ","
         << config.n_cores << "," << config.parameters.relaxation_rate << ","
         << wind.speed_ms << "," << wind.direction_deg << "," << result.computation_time << "\n";
}

} // namespace output
