#include "icns_writer.hpp"

#include <set>

#include "image_io.hpp"

namespace appicon {

namespace {

constexpr uint32_t kChunkHeaderSize = 8;

struct IcnsType {
    int edge;
    const char* type;
};

// clang-format off
const IcnsType kPngTypes[] = {
    { 16, "icp4" },
    { 32, "icp5" },
    { 64, "icp6" },
    { 128, "ic07" },
    { 256, "ic08" },
    { 512, "ic09" },
    { 1024, "ic10" },
};
// clang-format on

struct Element {
    const char* type;
    std::vector<uint8_t> png;
};

} // namespace

const char* icnsTypeForSize(int edge)
{
    for (const auto& entry : kPngTypes) {
        if (entry.edge == edge) {
            return entry.type;
        }
    }
    return nullptr;
}

bool encodeIcns(const cv::Mat& base, const std::vector<cv::Mat>& appended, std::vector<uint8_t>& out, std::string& err)
{
    std::vector<const cv::Mat*> images;
    images.push_back(&base);
    for (const auto& image : appended) {
        images.push_back(&image);
    }

    std::vector<Element> elements;
    std::set<int> edges;
    for (const auto* image : images) {
        auto edge = image->cols;
        if (image->rows != edge) {
            err = "icns images must be square, got " + std::to_string(image->cols) + "x" + std::to_string(image->rows);
            return false;
        }
        if (image->type() != CV_8UC4) {
            err = "icns image " + std::to_string(edge) + "px is not a 4 channel image";
            return false;
        }

        auto type = icnsTypeForSize(edge);
        if (!type) {
            err = "no icns element type for " + std::to_string(edge) + "x" + std::to_string(edge);
            return false;
        }
        if (!edges.insert(edge).second) {
            err = "more than one " + std::to_string(edge) + "px image";
            return false;
        }

        Element element;
        element.type = type;
        if (!encodePng(*image, element.png, err)) {
            return false;
        }
        elements.push_back(std::move(element));
    }

    auto tocLength = kChunkHeaderSize + kChunkHeaderSize * static_cast<uint32_t>(elements.size());
    auto total = kChunkHeaderSize + tocLength;
    for (const auto& element : elements) {
        total += kChunkHeaderSize + static_cast<uint32_t>(element.png.size());
    }

    out.clear();
    out.reserve(total);
    appendTag(out, "icns");
    appendBe32(out, total);

    appendTag(out, "TOC ");
    appendBe32(out, tocLength);
    for (const auto& element : elements) {
        appendTag(out, element.type);
        appendBe32(out, kChunkHeaderSize + static_cast<uint32_t>(element.png.size()));
    }

    for (const auto& element : elements) {
        appendTag(out, element.type);
        appendBe32(out, kChunkHeaderSize + static_cast<uint32_t>(element.png.size()));
        out.insert(out.end(), element.png.begin(), element.png.end());
    }
    return true;
}

StageResult buildIcns(const cv::Mat& master, const IconConfig& config, const Resampler& resampler, const Console& console)
{
    const std::string stage = "icns";
    auto path = config.outputRoot / "icon.icns";

    auto sizes = icnsDistinctSizes(config);
    if (sizes.empty()) {
        return StageResult::failure(stage, ErrorKind::EncodeError, "no icns layers configured.");
    }

    for (const auto& [key, layer] : config.icnsLayers) {
        console.detail("icns " + key + " -> " + layer.name + " (" + std::to_string(layer.size) + "px, " + layer.type + ")");
    }

    std::vector<uint8_t> data;
    std::string err;
    try {
        // Sizes are ascending, so the last render is the largest.
        std::vector<cv::Mat> renders;
        for (auto size : sizes) {
            renders.push_back(resampler.resizeSquare(master, size, Filter::Smooth));
        }

        auto base = renders.back();
        renders.pop_back();

        if (!encodeIcns(base, renders, data, err)) {
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
