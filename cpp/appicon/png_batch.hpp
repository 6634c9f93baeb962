#ifndef APPICON_PNG_BATCH_HPP
#define APPICON_PNG_BATCH_HPP

#include <opencv2/opencv.hpp>

#include "config.hpp"
#include "console.hpp"
#include "resampler.hpp"
#include "result.hpp"

namespace appicon {

// Writes one square PNG per target, resampled with the sharp filter.
// A failing entry is recorded and the remaining entries still run.
StageResult writePngBatch(const cv::Mat& master, const IconConfig& config, const Resampler& resampler, const Console& console);

} // namespace appicon

#endif
