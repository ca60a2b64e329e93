#include "engine_error.hpp"

namespace CardSort {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:     return "InvalidInput";
        case ErrorKind::AlreadyRunning:   return "AlreadyRunning";
        case ErrorKind::InvalidOperation: return "InvalidOperation";
        case ErrorKind::HookFailure:      return "HookFailure";
        case ErrorKind::EmptySequence:    return "EmptySequence";
    }
    return "Unknown";
}

EngineError::EngineError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(errorKindName(kind)) + ": " + message),
      kind_(kind)
{
}

} // namespace CardSort
