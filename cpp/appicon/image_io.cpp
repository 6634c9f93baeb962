#include "image_io.hpp"

#include <fstream>
#include <system_error>

namespace appicon {

namespace {

// Fixed level; repeated runs must produce identical files.
const std::vector<int> kPngParams = { cv::IMWRITE_PNG_COMPRESSION, 9 };

} // namespace

bool encodePng(const cv::Mat& image, std::vector<uint8_t>& out, std::string& err)
{
    std::vector<uchar> buffer;
    try {
        if (!cv::imencode(".png", image, buffer, kPngParams)) {
            err = "png encoder rejected " + std::to_string(image.cols) + "x" + std::to_string(image.rows) + " image";
            return false;
        }
    } catch (const cv::Exception& e) {
        err = e.what();
        return false;
    }
    out.assign(buffer.begin(), buffer.end());
    return true;
}

bool writePng(const std::filesystem::path& path, const cv::Mat& image, std::string& err)
{
    // Always PNG, whatever extension the target path carries.
    std::vector<uint8_t> png;
    if (!encodePng(image, png, err)) {
        err = "\"" + path.string() + "\" failed to encode: " + err;
        return false;
    }
    return writeFile(path, png, err);
}

bool ensureDirectory(const std::filesystem::path& dir, std::string& err)
{
    if (dir.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        err = "\"" + dir.string() + "\" could not be created: " + ec.message();
        return false;
    }
    return true;
}

bool writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data, std::string& err)
{
    std::ofstream fout;
    fout.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!fout) {
        err = "\"" + path.string() + "\" could not be opened for writing.";
        return false;
    }
    fout.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    fout.close();
    if (!fout) {
        err = "\"" + path.string() + "\" failed to write.";
        return false;
    }
    return true;
}

void appendLe16(std::vector<uint8_t>& out, uint16_t value)
{
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void appendLe32(std::vector<uint8_t>& out, uint32_t value)
{
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

void appendBe32(std::vector<uint8_t>& out, uint32_t value)
{
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void appendTag(std::vector<uint8_t>& out, const char* tag)
{
    out.insert(out.end(), tag, tag + 4);
}

} // namespace appicon
