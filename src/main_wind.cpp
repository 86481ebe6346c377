#include "errors.hpp"
#include "output.hpp"
#include "visualize.hpp"
#include "wind.hpp"

#include <exception>
#include <iostream>
#include <string>

//────────────────────────────────────────────────────────────────────────────
//  windlbm [n_cores] [wind_speed_ms] [wind_direction_deg] [mask_file] [output_dir]
//  All arguments are positional and optional.
//────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    try {
        // (1) Number of OpenMP threads
        const size_t n_cores = (argc > 1) ? std::stoul(argv[1]) : 1;

        //────────────────────────────────────────────────────────────────────────────
        // (2) Wind conditions (defaults when no weather data is supplied)
        //────────────────────────────────────────────────────────────────────────────
        WindCondition wind;
        wind.speed_ms      = (argc > 2) ? std::stod(argv[2]) : 5.0;    // [m/s]
        wind.direction_deg = (argc > 3) ? std::stod(argv[3]) : 270.0;  // from West

        //────────────────────────────────────────────────────────────────────────────
        // (3) Obstacles: mask file, or a synthetic scene
        //────────────────────────────────────────────────────────────────────────────
        const int NX = 200;       // # nodes in x (default scene)
        const int NY = 120;       // # nodes in y (default scene)
        const ObstacleMask mask = (argc > 4) ? output::LoadObstacleMask(argv[4])
                                             : output::DefaultScene(NX, NY);

        const std::string output_dir = (argc > 5) ? argv[5] : "build/output";

        //────────────────────────────────────────────────────────────────────────────
        // (4) Solver and sampling parameters
        //────────────────────────────────────────────────────────────────────────────
        SimulationConfig config;
        config.n_cores = n_cores;
        config.parameters.max_iterations   = 4000;
        config.parameters.relaxation_rate  = 1.4;
        config.parameters.buffer_size      = 10;
        config.parameters.vector_stride    = 5;
        config.parameters.output_precision = 4;
        config.features = FeatureFlags::Enhanced();
        // Options:
        // • FeatureFlags::Basic()    : statistics + vector field only
        // • FeatureFlags::Enhanced() : + streamlines, particles, convergence, vorticity

        //────────────────────────────────────────────────────────────────────────────
        // (5) Run and export
        //────────────────────────────────────────────────────────────────────────────
        const WindResult result = RunWindSimulation(mask, wind, config);

        output::ExportResults(output_dir, result, config);
        visualize::RenderResults(output_dir, result, mask);
        output::AppendRunLog("build/simulation_time_wind_details.csv", result, wind, config);

        const sampler::FlowStatistics& s = result.flow_statistics;
        std::cout << "Grid size: " << result.width << "x" << result.height
                  << ", obstacles: " << result.obstacle_count << "\n"
                  << "Vector count: " << result.vector_field.size() << "\n"
                  << "Wind speed range: " << s.min << " - " << s.max << " m/s"
                  << " (mean " << s.mean << ")" << std::endl;
    } catch (const InvalidInput& e) {
        std::cerr << "Invalid input: " << e.what() << std::endl;
        return 1;
    } catch (const ResourceExhaustion& e) {
        std::cerr << "Out of resources: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
