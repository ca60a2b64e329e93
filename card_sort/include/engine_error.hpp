#ifndef CARD_SORT_ENGINE_ERROR_HPP
#define CARD_SORT_ENGINE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace CardSort {

enum class ErrorKind {
    InvalidInput,     // empty or malformed dataset / configuration
    AlreadyRunning,   // request made while a run is active
    InvalidOperation, // non-adjacent swap or out-of-range index
    HookFailure,      // an awaited renderer hook rejected
    EmptySequence     // run requested before any dataset exists
};

const char* errorKindName(ErrorKind kind);

// Single exception type thrown by the engine; the kind tells callers
// which rejection happened.
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace CardSort

#endif // CARD_SORT_ENGINE_ERROR_HPP
