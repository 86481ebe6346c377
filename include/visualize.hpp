// visualize.hpp
#pragma once

#include "lattice.hpp"
#include "sampler.hpp"
#include "wind.hpp"

#include <vector>
#include <string>
#include <filesystem>

#include <opencv2/opencv.hpp>

namespace visualize {

//---------------------------------------------------------------------------
// Offline rendering of a finished run to PNG
//---------------------------------------------------------------------------

// Render the magnitude map and, if present, the convergence plot into output_dir
void RenderResults(const std::string& output_dir, const WindResult& result,
                   const ObstacleMask& mask);

// |u| heat map (JET) with obstacles in dark grey and streamlines in white.
// Row 0 (North) is drawn at the top. Small grids are upscaled by `zoom`.
cv::Mat RenderMagnitudeMap(const VelocityField& field, const ObstacleMask& mask,
                           const std::vector<sampler::Streamline>& streamlines,
                           const int zoom);

//---------------------------------------------------------------------------
// Internal plotting helper
//---------------------------------------------------------------------------

// Plot the tracked samples (every `interval` iterations) of a time series
cv::Mat PlotTimeSeriesWithOpenCV(const std::vector<double>& data, const int interval,
                                 const std::string& title);

//---------------------------------------------------------------------------
// Helper for the images
//---------------------------------------------------------------------------
cv::Mat normalize_and_color(const cv::Mat& src, const double vmin, const double vmax);
cv::Mat wrap_with_label(const cv::Mat& img, const std::string& label);

} // namespace visualize
