#include "source_loader.hpp"

#include <system_error>
#include <vector>

namespace appicon {

bool normalizeToBgra(const cv::Mat& src, cv::Mat& dst, std::string& err)
{
    cv::Mat eightBit;
    switch (src.depth()) {
    case CV_8U:
        eightBit = src;
        break;
    case CV_16U:
        src.convertTo(eightBit, CV_8U, 1.0 / 257.0);
        break;
    default:
        err = "unsupported pixel depth";
        return false;
    }

    switch (eightBit.channels()) {
    case 1:
        cv::cvtColor(eightBit, dst, cv::COLOR_GRAY2BGRA);
        return true;
    case 2: {
        // Grey + alpha is not a cvtColor code; expand by hand.
        std::vector<cv::Mat> channels;
        cv::split(eightBit, channels);
        cv::merge(std::vector<cv::Mat> { channels[0], channels[0], channels[0], channels[1] }, dst);
        return true;
    }
    case 3:
        cv::cvtColor(eightBit, dst, cv::COLOR_BGR2BGRA);
        return true;
    case 4:
        dst = eightBit.clone();
        return true;
    }

    err = "unsupported channel count " + std::to_string(eightBit.channels());
    return false;
}

LoadResult loadMaster(const std::filesystem::path& path)
{
    LoadResult result;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.error = ErrorKind::InputNotFound;
        result.message = "\"" + path.string() + "\" input file not found.";
        return result;
    }

    cv::Mat decoded;
    try {
        decoded = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        result.error = ErrorKind::DecodeError;
        result.message = "\"" + path.string() + "\" failed to decode: " + e.what();
        return result;
    }

    if (!decoded.data) {
        result.error = ErrorKind::DecodeError;
        result.message = "\"" + path.string() + "\" is not a readable image.";
        return result;
    }

    result.sourceChannels = decoded.channels();

    std::string err;
    auto normalized = false;
    try {
        normalized = normalizeToBgra(decoded, result.image, err);
    } catch (const cv::Exception& e) {
        err = e.what();
    }
    if (!normalized) {
        result.error = ErrorKind::DecodeError;
        result.message = "\"" + path.string() + "\" " + err + ".";
        result.image.release();
        return result;
    }

    return result;
}

} // namespace appicon
