#include "ico_writer.hpp"

#include "image_io.hpp"

namespace appicon {

namespace {

constexpr uint16_t kIcoTypeIcon = 1;
constexpr uint32_t kIcoHeaderSize = 6;
constexpr uint32_t kIcoEntrySize = 16;

// 256 does not fit the directory byte and is stored as 0.
uint8_t directoryDimension(int edge)
{
    return edge == kIcoMaxEdge ? 0 : static_cast<uint8_t>(edge);
}

std::string sizeName(int width, int height)
{
    return std::to_string(width) + "x" + std::to_string(height);
}

} // namespace

bool encodeIco(const std::vector<cv::Mat>& layers, std::vector<uint8_t>& out, std::string& err)
{
    if (layers.empty()) {
        err = "no layers to encode";
        return false;
    }
    if (layers.size() > 0xFFFF) {
        err = "too many layers";
        return false;
    }

    std::vector<std::vector<uint8_t>> payloads;
    for (const auto& layer : layers) {
        if (layer.type() != CV_8UC4) {
            err = "layer " + sizeName(layer.cols, layer.rows) + " is not a 4 channel image";
            return false;
        }
        if (layer.cols < 1 || layer.rows < 1 || layer.cols > kIcoMaxEdge || layer.rows > kIcoMaxEdge) {
            err = "layer " + sizeName(layer.cols, layer.rows) + " is outside the 1..256 range of the format";
            return false;
        }

        std::vector<uint8_t> png;
        if (!encodePng(layer, png, err)) {
            return false;
        }
        payloads.push_back(std::move(png));
    }

    out.clear();
    appendLe16(out, 0);
    appendLe16(out, kIcoTypeIcon);
    appendLe16(out, static_cast<uint16_t>(layers.size()));

    auto offset = kIcoHeaderSize + kIcoEntrySize * static_cast<uint32_t>(layers.size());
    for (size_t i = 0; i < layers.size(); i++) {
        out.push_back(directoryDimension(layers[i].cols));
        out.push_back(directoryDimension(layers[i].rows));
        out.push_back(0); // palette colours
        out.push_back(0); // reserved
        appendLe16(out, 1); // planes
        appendLe16(out, 32); // bits per pixel
        appendLe32(out, static_cast<uint32_t>(payloads[i].size()));
        appendLe32(out, offset);
        offset += static_cast<uint32_t>(payloads[i].size());
    }

    for (const auto& payload : payloads) {
        out.insert(out.end(), payload.begin(), payload.end());
    }
    return true;
}

StageResult buildIco(const cv::Mat& master, const IconConfig& config, const Resampler& resampler, const Console& console)
{
    const std::string stage = "ico";
    auto path = config.outputRoot / "icon.ico";

    auto sizes = icoDistinctSizes(config);
    if (sizes.empty()) {
        return StageResult::failure(stage, ErrorKind::EncodeError, "no ico sizes configured.");
    }

    std::vector<uint8_t> data;
    std::string err;
    try {
        std::vector<cv::Mat> layers;
        for (const auto& size : sizes) {
            if (size.width > kIcoMaxEdge || size.height > kIcoMaxEdge) {
                return StageResult::failure(stage, ErrorKind::EncodeError,
                    "\"" + path.string() + "\" unsupported layer size " + sizeName(size.width, size.height)
                        + " (maximum is 256x256).");
            }
            layers.push_back(resampler.resize(master, size.width, size.height, Filter::Smooth));
            console.detail("ico layer " + sizeName(size.width, size.height));
        }

        if (!encodeIco(layers, data, err)) {
            return StageResult::failure(stage, ErrorKind::EncodeError, "\"" + path.string() + "\" failed to encode: " + err);
        }
    } catch (const cv::Exception& e) {
        return StageResult::failure(stage, ErrorKind::EncodeError, "\"" + path.string() + "\" failed to resize: " + e.what());
    }

    if (!ensureDirectory(config.outputRoot, err) || !writeFile(path, data, err)) {
        return StageResult::failure(stage, ErrorKind::EncodeError, err);
    }

    return StageResult::success(stage, sizes.size());
}

} // namespace appicon
