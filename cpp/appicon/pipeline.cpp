#include "pipeline.hpp"

#include "ico_writer.hpp"
#include "icns_writer.hpp"
#include "image_io.hpp"
#include "png_batch.hpp"
#include "source_loader.hpp"

namespace appicon {

namespace {

void report(const StageResult& result, const Console& console)
{
    if (result.ok()) {
        return;
    }
    console.error("[" + result.stage + "] " + errorKindName(result.error) + ": " + result.message);
    for (const auto& failure : result.failures) {
        console.error("  " + failure);
    }
}

} // namespace

bool RunReport::ok() const
{
    if (loadError != ErrorKind::None) {
        return false;
    }
    for (const auto& stage : stages) {
        if (!stage.ok()) {
            return false;
        }
    }
    return true;
}

RunReport runPipeline(const IconConfig& config, const Resampler& resampler, const Console& console)
{
    RunReport run;

    auto loaded = loadMaster(config.input);
    if (!loaded.ok()) {
        run.loadError = loaded.error;
        run.loadMessage = loaded.message;
        console.error(std::string(errorKindName(loaded.error)) + ": " + loaded.message);
        return run;
    }
    console.progress("Loaded \"" + config.input.string() + "\" (" + std::to_string(loaded.image.cols) + "x"
        + std::to_string(loaded.image.rows) + ", " + std::to_string(loaded.sourceChannels) + " channels -> BGRA).");

    const cv::Mat& master = loaded.image;

    std::string err;
    if (!ensureDirectory(config.outputRoot, err)) {
        run.stages.push_back(StageResult::failure("output", ErrorKind::EncodeError, err));
        report(run.stages.back(), console);
        return run;
    }

    console.progress("Generating png icons...");
    run.stages.push_back(writePngBatch(master, config, resampler, console));
    report(run.stages.back(), console);
    console.progress(std::to_string(run.stages.back().written) + " png icons written to \"" + config.outputRoot.string() + "\".");

    console.progress("Generating icon.ico...");
    run.stages.push_back(buildIco(master, config, resampler, console));
    report(run.stages.back(), console);
    if (run.stages.back().ok()) {
        console.progress("icon.ico written (" + std::to_string(run.stages.back().written) + " layers).");
    }

    console.progress("Generating icon.icns...");
    run.stages.push_back(buildIcns(master, config, resampler, console));
    report(run.stages.back(), console);
    if (run.stages.back().ok()) {
        console.progress("icon.icns written (" + std::to_string(run.stages.back().written) + " layers).");
    }

    return run;
}

} // namespace appicon
