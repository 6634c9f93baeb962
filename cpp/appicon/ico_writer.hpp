#ifndef APPICON_ICO_WRITER_HPP
#define APPICON_ICO_WRITER_HPP

#include <cstdint>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "config.hpp"
#include "console.hpp"
#include "resampler.hpp"
#include "result.hpp"

namespace appicon {

constexpr int kIcoMaxEdge = 256;

// Builds an ICO container with one PNG compressed entry per layer, in the
// given order. Every layer must be CV_8UC4 with edges in 1..256.
bool encodeIco(const std::vector<cv::Mat>& layers, std::vector<uint8_t>& out, std::string& err);

// Renders every distinct ICO size with the smooth filter and writes
// <outputRoot>/icon.ico.
StageResult buildIco(const cv::Mat& master, const IconConfig& config, const Resampler& resampler, const Console& console);

} // namespace appicon

#endif
