#ifndef APPICON_SOURCE_LOADER_HPP
#define APPICON_SOURCE_LOADER_HPP

#include <filesystem>
#include <opencv2/opencv.hpp>
#include <string>

#include "result.hpp"

namespace appicon {

struct LoadResult {
    cv::Mat image; // CV_8UC4, BGRA
    ErrorKind error = ErrorKind::None;
    std::string message;
    int sourceChannels = 0;

    bool ok() const { return error == ErrorKind::None; }
};

LoadResult loadMaster(const std::filesystem::path& path);

// Converts any 1, 2, 3 or 4 channel image of 8 or 16 bit depth to CV_8UC4.
bool normalizeToBgra(const cv::Mat& src, cv::Mat& dst, std::string& err);

} // namespace appicon

#endif
