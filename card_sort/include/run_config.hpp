#ifndef CARD_SORT_RUN_CONFIG_HPP
#define CARD_SORT_RUN_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "sort.hpp"

namespace CardSort {

enum class Speed { Slow, Medium, Fast };

// Dataset values are drawn without repetition from [kMinValue, kMaxValue],
// which also caps the dataset size.
constexpr int kMinValue = 10;
constexpr int kMaxValue = 99;
constexpr int kMinSize = 1;
constexpr int kMaxSize = kMaxValue - kMinValue + 1;
constexpr int kDefaultSize = 12;

// Time a swap animation takes at the given speed (700 / 380 / 160 ms).
std::chrono::milliseconds stepDelay(Speed speed);

// Comparison highlight: 40% of the step delay.
std::chrono::milliseconds compareDelay(Speed speed);

const char* speedLabel(Speed speed);

/**
 * @brief Accepts "slow", "medium", "fast" (any case) or the slider values "1", "2", "3".
 * @throws EngineError(InvalidInput) otherwise.
 */
Speed parseSpeed(const std::string& text);

struct RunConfig {
    Algorithm algorithm = Algorithm::Bubble;
    int size = kDefaultSize;
    Speed speed = Speed::Medium;
    std::uint32_t seed = 0; // 0 picks a seed from std::random_device
    bool verbose = false;
};

/**
 * @brief Reads `<algorithm> [size] [speed] [seed]` plus an optional `--verbose`
 * flag anywhere in the list.
 * @throws EngineError(InvalidInput) on a missing algorithm, unknown names,
 * non-numeric or out-of-range size, or surplus arguments.
 */
RunConfig parseRunConfig(const std::vector<std::string>& args);

/**
 * @brief n distinct values from [kMinValue, kMaxValue] in shuffled order.
 * @throws EngineError(InvalidInput) unless kMinSize <= n <= kMaxSize.
 */
std::vector<int> generateValues(int n, std::uint32_t seed);

} // namespace CardSort

#endif // CARD_SORT_RUN_CONFIG_HPP
