#ifndef APPICON_RESAMPLER_HPP
#define APPICON_RESAMPLER_HPP

#include <opencv2/opencv.hpp>
#include <string>

namespace appicon {

enum class Filter {
    Sharp,
    Smooth,
};

// Interpolation choice for one filter role. |auto| picks area averaging
// when shrinking and Lanczos when enlarging.
struct FilterMode {
    std::string name;
    int interpolation = cv::INTER_NEAREST_EXACT;
    bool automatic = false;
};

bool resolveFilterMode(const std::string& name, FilterMode& mode, std::string& err);

class Resampler {
public:
    static bool create(const std::string& sharpName, const std::string& smoothName, Resampler& out, std::string& err);

    // Resizes |src| (CV_8UC4) to exactly width x height.
    cv::Mat resize(const cv::Mat& src, int width, int height, Filter filter) const;
    cv::Mat resizeSquare(const cv::Mat& src, int size, Filter filter) const
    {
        return resize(src, size, size, filter);
    }

    const FilterMode& sharp() const { return sharp_; }
    const FilterMode& smooth() const { return smooth_; }

private:
    FilterMode sharp_;
    FilterMode smooth_;
};

} // namespace appicon

#endif
