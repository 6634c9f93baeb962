#include "png_batch.hpp"

#include "image_io.hpp"

namespace appicon {

StageResult writePngBatch(const cv::Mat& master, const IconConfig& config, const Resampler& resampler, const Console& console)
{
    auto result = StageResult::success("png", 0);

    for (const auto& target : config.pngTargets) {
        auto path = config.outputRoot / target.path;

        std::string err;
        if (!ensureDirectory(path.parent_path(), err)) {
            result.failures.push_back(err);
            continue;
        }

        cv::Mat img;
        try {
            img = resampler.resizeSquare(master, target.size, Filter::Sharp);
        } catch (const cv::Exception& e) {
            result.failures.push_back("\"" + path.string() + "\" failed to resize: " + e.what());
            continue;
        }

        if (!writePng(path, img, err)) {
            result.failures.push_back(err);
            continue;
        }
        img.release();

        console.detail(path.string() + " (" + std::to_string(target.size) + "x" + std::to_string(target.size) + ")");
        result.written++;
    }

    if (!result.failures.empty()) {
        result.error = ErrorKind::EncodeError;
        result.message = std::to_string(result.failures.size()) + " of " + std::to_string(config.pngTargets.size())
            + " png files failed.";
    }
    return result;
}

} // namespace appicon
