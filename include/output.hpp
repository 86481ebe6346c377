#pragma once

#include "config.hpp"
#include "lattice.hpp"
#include "wind.hpp"

#include <string>

namespace output {

//---------------------------------------------------------------------------
// Obstacle masks
//---------------------------------------------------------------------------

// Text mask, one grid row per line (row 0 = North edge):
//   '1' or '#' = solid, '0' or '.' = fluid, blank lines ignored.
// Throws InvalidInput on a missing file, ragged rows or unknown characters.
ObstacleMask LoadObstacleMask(const std::string& path);

// Default scene when no mask is given: three rectangular buildings
ObstacleMask DefaultScene(const int NX, const int NY);

//---------------------------------------------------------------------------
// CSV export of a finished run, one file per artifact in output_dir.
// Throws std::runtime_error when a file cannot be written.
//---------------------------------------------------------------------------
void WriteFlowStatistics(const std::string& path, const WindResult& result, const int precision);
void WriteVectorField(const std::string& path, const WindResult& result, const int precision);
void WriteMagnitudeGrid(const std::string& path, const WindResult& result, const int precision);
void WriteStreamlines(const std::string& path, const WindResult& result, const int precision);
void WriteParticles(const std::string& path, const WindResult& result, const int precision);
void WriteConvergenceHistory(const std::string& path, const WindResult& result);

// key,value rows: timestamp, wind, solver settings, thread count
void WriteRunMetadata(const std::string& path, const WindResult& result);

// All of the above that apply to this run
void ExportResults(const std::string& output_dir, const WindResult& result,
                   const SimulationConfig& config);

// One line per run appended to a timing log (header written when empty)
void AppendRunLog(const std::string& path, const WindResult& result,
                  const WindCondition& wind, const SimulationConfig& config);

} // namespace output
