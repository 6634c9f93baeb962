#ifndef APPICON_IMAGE_IO_HPP
#define APPICON_IMAGE_IO_HPP

#include <cstdint>
#include <filesystem>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace appicon {

// PNG stream of a CV_8UC4 image, as embedded in ICO and ICNS containers.
bool encodePng(const cv::Mat& image, std::vector<uint8_t>& out, std::string& err);

bool writePng(const std::filesystem::path& path, const cv::Mat& image, std::string& err);

// Creates |dir| and its parents; succeeds if it already exists.
bool ensureDirectory(const std::filesystem::path& dir, std::string& err);

bool writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data, std::string& err);

void appendLe16(std::vector<uint8_t>& out, uint16_t value);
void appendLe32(std::vector<uint8_t>& out, uint32_t value);
void appendBe32(std::vector<uint8_t>& out, uint32_t value);
void appendTag(std::vector<uint8_t>& out, const char* tag);

} // namespace appicon

#endif
