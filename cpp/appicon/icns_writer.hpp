#ifndef APPICON_ICNS_WRITER_HPP
#define APPICON_ICNS_WRITER_HPP

#include <cstdint>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "config.hpp"
#include "console.hpp"
#include "resampler.hpp"
#include "result.hpp"

namespace appicon {

// PNG capable element type for a square edge, or nullptr if the format
// has none for that size.
const char* icnsTypeForSize(int edge);

// Builds an ICNS container. |base| is stored first, followed by
// |appended| in order. Each image gets the element type inferred from its
// edge; two images of the same edge are rejected.
bool encodeIcns(const cv::Mat& base, const std::vector<cv::Mat>& appended, std::vector<uint8_t>& out, std::string& err);

// Renders each distinct layer size once with the smooth filter and writes
// <outputRoot>/icon.icns with the largest render as the base image.
StageResult buildIcns(const cv::Mat& master, const IconConfig& config, const Resampler& resampler, const Console& console);

} // namespace appicon

#endif
