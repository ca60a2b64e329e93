#include "run_config.hpp"
#include "engine_error.hpp"

#include <algorithm>
#include <cctype>
#include <numeric> // For std::iota
#include <random>
#include <stdexcept>

namespace CardSort {

std::chrono::milliseconds stepDelay(Speed speed) {
    switch (speed) {
        case Speed::Slow:   return std::chrono::milliseconds(700);
        case Speed::Medium: return std::chrono::milliseconds(380);
        case Speed::Fast:   return std::chrono::milliseconds(160);
    }
    return std::chrono::milliseconds(380);
}

std::chrono::milliseconds compareDelay(Speed speed) {
    return stepDelay(speed) * 4 / 10;
}

const char* speedLabel(Speed speed) {
    switch (speed) {
        case Speed::Slow:   return "Slow";
        case Speed::Medium: return "Medium";
        case Speed::Fast:   return "Fast";
    }
    return "Medium";
}

Speed parseSpeed(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "slow" || lower == "1") return Speed::Slow;
    if (lower == "medium" || lower == "2") return Speed::Medium;
    if (lower == "fast" || lower == "3") return Speed::Fast;
    throw EngineError(ErrorKind::InvalidInput,
                      "unknown speed '" + text + "' (expected slow, medium or fast)");
}

namespace {

// Whole-string parse; std::stol alone accepts trailing junk.
long parseNumber(const std::string& text, const char* what) {
    std::size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::logic_error&) {
        throw EngineError(ErrorKind::InvalidInput, std::string(what) + " '" + text + "' is not a number");
    }
    if (used != text.size()) {
        throw EngineError(ErrorKind::InvalidInput, std::string(what) + " '" + text + "' is not a number");
    }
    return value;
}

void checkSize(long size) {
    if (size < kMinSize || size > kMaxSize) {
        throw EngineError(ErrorKind::InvalidInput,
                          "size " + std::to_string(size) + " outside [" + std::to_string(kMinSize) +
                          ", " + std::to_string(kMaxSize) + "]");
    }
}

} // namespace

RunConfig parseRunConfig(const std::vector<std::string>& args) {
    RunConfig config;
    std::vector<std::string> positional;
    for (const auto& arg : args) {
        if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        throw EngineError(ErrorKind::InvalidInput, "missing algorithm name");
    }
    if (positional.size() > 4) {
        throw EngineError(ErrorKind::InvalidInput, "too many arguments");
    }

    config.algorithm = parseAlgorithm(positional[0]);
    if (positional.size() > 1) {
        long size = parseNumber(positional[1], "size");
        checkSize(size);
        config.size = static_cast<int>(size);
    }
    if (positional.size() > 2) {
        config.speed = parseSpeed(positional[2]);
    }
    if (positional.size() > 3) {
        long seed = parseNumber(positional[3], "seed");
        if (seed < 0 || seed > static_cast<long>(UINT32_MAX)) {
            throw EngineError(ErrorKind::InvalidInput, "seed '" + positional[3] + "' out of range");
        }
        config.seed = static_cast<std::uint32_t>(seed);
    }
    return config;
}

std::vector<int> generateValues(int n, std::uint32_t seed) {
    checkSize(n);

    std::vector<int> pool(kMaxSize);
    std::iota(pool.begin(), pool.end(), kMinValue);

    std::mt19937 rng(seed != 0 ? seed : std::random_device{}());
    // Fisher-Yates from the back.
    for (int i = static_cast<int>(pool.size()) - 1; i > 0; --i) {
        std::uniform_int_distribution<int> pick(0, i);
        std::swap(pool[i], pool[pick(rng)]);
    }
    pool.resize(n);
    return pool;
}

} // namespace CardSort
