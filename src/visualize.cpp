// visualize.cpp
#include "visualize.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

namespace visualize {

// --- Global parameters for images ---
constexpr int border        = 10;
constexpr int label_height  = 30;
constexpr int target_width  = 800;   // small grids are upscaled towards this width

static const cv::Vec3b obstacle_color(60, 60, 60);

//---------------------------------------------------------------------------
// RenderResults
//---------------------------------------------------------------------------

void RenderResults(const std::string& output_dir, const WindResult& result,
                   const ObstacleMask& mask) {
    std::filesystem::create_directories(output_dir);
    const std::filesystem::path dir(output_dir);

    const int zoom = std::max(1, target_width / std::max(1, result.width));

    std::vector<std::pair<cv::Mat, std::string>> images;
    images.push_back({RenderMagnitudeMap(result.velocity, mask, result.streamlines, zoom),
                      "wind_magnitude.png"});
    if (!result.convergence_history.empty()) {
        images.push_back({PlotTimeSeriesWithOpenCV(result.convergence_history,
                                                   WindLBM::kConvergenceInterval, "mean u^2"),
                          "convergence.png"});
    }

    for (const auto& [img, name] : images) {
        if (img.empty()) continue;
        const std::string path = (dir / name).string();
        if (!cv::imwrite(path, img)) {
            std::cerr << "Cannot write " << path << "\n";
        }
    }
    std::cout << "Images generated.\n";
}

//---------------------------------------------------------------------------
// Magnitude map
//---------------------------------------------------------------------------

cv::Mat RenderMagnitudeMap(const VelocityField& field, const ObstacleMask& mask,
                           const std::vector<sampler::Streamline>& streamlines,
                           const int zoom) {
    const int NX = field.NX, NY = field.NY;
    cv::Mat mag(NY, NX, CV_32F);

    double vmax = 0.0;
    #pragma omp parallel for collapse(2) reduction(max:vmax)
    for (int y = 0; y < NY; ++y)
        for (int x = 0; x < NX; ++x) {
            const int idx = INDEX(x, y, NX, NY);
            const double m = std::sqrt(field.ux[idx] * field.ux[idx] + field.uy[idx] * field.uy[idx]);
            mag.at<float>(y, x) = static_cast<float>(m);
            vmax = std::max(vmax, m);
        }
    if (vmax <= 0.0) vmax = 1.0; // if constant value avoid a division by zero

    cv::Mat color = normalize_and_color(mag, 0.0, vmax);

    // Obstacles on top of the colour map
    for (int y = 0; y < NY; ++y)
        for (int x = 0; x < NX; ++x)
            if (mask(x, y)) color.at<cv::Vec3b>(y, x) = obstacle_color;

    cv::Mat scaled;
    cv::resize(color, scaled, cv::Size(NX * zoom, NY * zoom), 0, 0, cv::INTER_NEAREST);

    // Streamlines in cell coordinates, drawn through cell centres
    for (const auto& line : streamlines) {
        for (size_t k = 1; k < line.size(); ++k) {
            const cv::Point p0(static_cast<int>((line[k - 1].x + 0.5) * zoom),
                               static_cast<int>((line[k - 1].y + 0.5) * zoom));
            const cv::Point p1(static_cast<int>((line[k].x + 0.5) * zoom),
                               static_cast<int>((line[k].y + 0.5) * zoom));
            cv::line(scaled, p0, p1, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
        }
    }

    return wrap_with_label(scaled, "|u| [m/s], max " + std::to_string(vmax));
}

//---------------------------------------------------------------------------
// Helper for the images
//---------------------------------------------------------------------------
cv::Mat normalize_and_color(const cv::Mat& src, const double vmin, const double vmax) {
    cv::Mat norm, color; //norm is the normalized image in 8 bit //color is the image colored
    src.convertTo(norm, CV_8U, 255.0 / (vmax - vmin), -vmin * 255.0 / (vmax - vmin)); //this normalize once maximum and miinimum value is given
    cv::applyColorMap(norm, color, cv::COLORMAP_JET); //this apply the Jet color
    return color;
}

cv::Mat wrap_with_label(const cv::Mat& img, const std::string& label) { //starting from img that is colored from before and the label chosen
    cv::Mat bordered; //this will be the image with borders
    cv::copyMakeBorder(img, bordered, border, border + label_height, border, border,
                       cv::BORDER_CONSTANT, cv::Scalar(255,255,255)); //this add borders
    cv::putText(bordered, label, cv::Point(border + 5, bordered.rows - 5),
                cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(0,0,0), 1);  //this write the label
    return bordered;
}

//---------------------------------------------------------------------------
// PlotTimeSeriesWithOpenCV
//---------------------------------------------------------------------------

cv::Mat PlotTimeSeriesWithOpenCV(const std::vector<double>& data, const int interval,
                                 const std::string& title) {
    // Only every interval-th entry was tracked
    std::vector<std::pair<int, double>> points;
    for (size_t t = 0; t < data.size(); t += interval)
        points.push_back({static_cast<int>(t), data[t]});
    if (points.size() < 2) return cv::Mat(); //nothing to draw

    const int T = static_cast<int>(data.size());

    // Find min/max to plot and see data
    double vmin = points[0].second, vmax = points[0].second;
    for (const auto& p : points) {
        vmin = std::min(vmin, p.second);
        vmax = std::max(vmax, p.second);
    }
    if (vmin == vmax) { vmin -= 1.0; vmax += 1.0; } // if constant value just add some space

    // Create plotting canvas
    const int W = 800, H = 600; //image size
    const int ml = 80, mr = 40, mt = 60, mb = 80; //additiona space for axis and labels
    cv::Mat img(H, W, CV_8UC3, cv::Scalar::all(255)); //define empty image

    // Draw axes
    cv::Point origin(ml, H-mb), xend(W-mr, H-mb), yend(ml, mt);
    cv::line(img, origin, xend, cv::Scalar(0,0,0));
    cv::line(img, origin, yend, cv::Scalar(0,0,0));
    cv::putText(img, title, {ml, mt/2},
                cv::FONT_HERSHEY_SIMPLEX, 0.8, {0,0,0}, 2);

    const double pw = W - ml - mr, ph = H - mt - mb; //total graph width and height
    const double xs = pw / std::max(1, T - 1), ys = ph / (vmax - vmin); //x and y steps

    for (size_t k = 1; k < points.size(); ++k) {
        //Point 0
        const int x0 = int(ml + xs * points[k - 1].first);
        const int y0 = int(H - mb - ys * (points[k - 1].second - vmin));
        //Point 1
        const int x1 = int(ml + xs * points[k].first);
        const int y1 = int(H - mb - ys * (points[k].second - vmin));
        cv::line(img, {x0, y0}, {x1, y1}, cv::Scalar(255,0,0), 1, cv::LINE_AA); //draw a line between point 0 and point 1
    }

    // Axis labels
    cv::putText(img, "iteration",
        {(ml + W-mr)/2, H-mb + 40},
        cv::FONT_HERSHEY_SIMPLEX, 0.6, {0,0,0}, 1
    ); //x axis
    cv::putText(img, title,
        {10, (mt + H-mb)/2},
        cv::FONT_HERSHEY_SIMPLEX, 0.6, {0,0,0}, 1
    ); // y axis

    return img; //return image
}

} // namespace visualize
