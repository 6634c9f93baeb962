#ifndef APPICON_PIPELINE_HPP
#define APPICON_PIPELINE_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "console.hpp"
#include "resampler.hpp"
#include "result.hpp"

namespace appicon {

struct RunReport {
    ErrorKind loadError = ErrorKind::None;
    std::string loadMessage;
    std::vector<StageResult> stages;

    bool ok() const;
};

// Loads the master image, then runs the png, ico and icns stages in that
// order. A load failure stops the run before anything is written; a stage
// failure is reported and the next stage still runs.
RunReport runPipeline(const IconConfig& config, const Resampler& resampler, const Console& console);

} // namespace appicon

#endif
