#include "result.hpp"

namespace appicon {

const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::InputNotFound:
        return "InputNotFound";
    case ErrorKind::DecodeError:
        return "DecodeError";
    case ErrorKind::EncodeError:
        return "EncodeError";
    case ErrorKind::ConfigError:
        return "ConfigError";
    }
    return "Unknown";
}

} // namespace appicon
