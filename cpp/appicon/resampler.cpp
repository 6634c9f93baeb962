#include "resampler.hpp"

#include <vector>

namespace appicon {

namespace {

struct NamedInterpolation {
    const char* name;
    int interpolation;
};

const NamedInterpolation kInterpolations[] = {
    { "nearest-exact", cv::INTER_NEAREST_EXACT },
    { "nearest", cv::INTER_NEAREST },
    { "linear", cv::INTER_LINEAR },
    { "cubic", cv::INTER_CUBIC },
    { "area", cv::INTER_AREA },
    { "lanczos", cv::INTER_LANCZOS4 },
};

bool isPointSampling(int interpolation)
{
    return interpolation == cv::INTER_NEAREST || interpolation == cv::INTER_NEAREST_EXACT;
}

// Blending filters work on premultiplied colour so fully transparent pixels
// contribute nothing to their neighbours.
cv::Mat resizePremultiplied(const cv::Mat& src, const cv::Size& size, int interpolation)
{
    std::vector<cv::Mat> channels;
    cv::split(src, channels);

    cv::Mat alpha;
    channels[3].convertTo(alpha, CV_32F, 1.0 / 255.0);

    std::vector<cv::Mat> premultiplied(4);
    for (int c = 0; c < 3; c++) {
        channels[c].convertTo(premultiplied[c], CV_32F);
        cv::multiply(premultiplied[c], alpha, premultiplied[c]);
    }
    channels[3].convertTo(premultiplied[3], CV_32F);

    cv::Mat merged;
    cv::merge(premultiplied, merged);

    cv::Mat scaled;
    cv::resize(merged, scaled, size, 0, 0, interpolation);

    std::vector<cv::Mat> out;
    cv::split(scaled, out);

    // Lanczos and cubic may overshoot; clamp alpha before dividing.
    cv::Mat scaledAlpha = cv::min(out[3], 255.0);
    scaledAlpha = cv::max(scaledAlpha, 0.0);
    cv::Mat divisor = scaledAlpha / 255.0;
    cv::Mat transparent = divisor <= 0.0;
    divisor.setTo(1.0, transparent);

    std::vector<cv::Mat> result(4);
    for (int c = 0; c < 3; c++) {
        cv::Mat colour;
        cv::divide(out[c], divisor, colour);
        colour.setTo(0.0, transparent);
        colour.convertTo(result[c], CV_8U);
    }
    scaledAlpha.convertTo(result[3], CV_8U);

    cv::Mat dst;
    cv::merge(result, dst);
    return dst;
}

} // namespace

bool resolveFilterMode(const std::string& name, FilterMode& mode, std::string& err)
{
    if (name == "auto") {
        mode.name = name;
        mode.interpolation = cv::INTER_AREA;
        mode.automatic = true;
        return true;
    }

    for (const auto& entry : kInterpolations) {
        if (name == entry.name) {
            mode.name = name;
            mode.interpolation = entry.interpolation;
            mode.automatic = false;
            return true;
        }
    }

    err = "\"" + name + "\" is not a known filter (expected one of auto, nearest-exact, nearest, linear, cubic, area, lanczos)";
    return false;
}

bool Resampler::create(const std::string& sharpName, const std::string& smoothName, Resampler& out, std::string& err)
{
    Resampler resampler;
    if (!resolveFilterMode(sharpName, resampler.sharp_, err)) {
        err = "sharp filter: " + err;
        return false;
    }
    if (!resolveFilterMode(smoothName, resampler.smooth_, err)) {
        err = "smooth filter: " + err;
        return false;
    }
    out = resampler;
    return true;
}

cv::Mat Resampler::resize(const cv::Mat& src, int width, int height, Filter filter) const
{
    CV_Assert(src.type() == CV_8UC4);
    CV_Assert(width > 0 && height > 0);

    const auto& mode = filter == Filter::Sharp ? sharp_ : smooth_;
    auto interpolation = mode.interpolation;
    if (mode.automatic) {
        auto shrinking = width <= src.cols && height <= src.rows;
        interpolation = shrinking ? cv::INTER_AREA : cv::INTER_LANCZOS4;
    }

    cv::Size size(width, height);
    if (size == src.size()) {
        return src.clone();
    }

    if (isPointSampling(interpolation)) {
        cv::Mat dst;
        cv::resize(src, dst, size, 0, 0, interpolation);
        return dst;
    }
    return resizePremultiplied(src, size, interpolation);
}

} // namespace appicon
