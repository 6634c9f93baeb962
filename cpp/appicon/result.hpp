#ifndef APPICON_RESULT_HPP
#define APPICON_RESULT_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace appicon {

enum class ErrorKind {
    None,
    InputNotFound,
    DecodeError,
    EncodeError,
    ConfigError,
};

const char* errorKindName(ErrorKind kind);

// Outcome of one generation stage. A failed stage never aborts the run.
struct StageResult {
    std::string stage;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::size_t written = 0; // files for the PNG batch, layers for containers
    std::vector<std::string> failures;

    bool ok() const { return error == ErrorKind::None; }

    static StageResult success(const std::string& stage, std::size_t written)
    {
        StageResult result;
        result.stage = stage;
        result.written = written;
        return result;
    }

    static StageResult failure(const std::string& stage, ErrorKind error, const std::string& message)
    {
        StageResult result;
        result.stage = stage;
        result.error = error;
        result.message = message;
        return result;
    }
};

} // namespace appicon

#endif
