// main.cpp
#include "engine_error.hpp"
#include "run_config.hpp"
#include "run_controller.hpp"
#include "step_hook.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <string>
#include <vector>

std::string formatValues(const std::vector<int>& values) {
    std::ostringstream out;
    for (int val : values) {
        out << val << " ";
    }
    return out.str();
}

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    CardSort::RunConfig config;
    try {
        config = CardSort::parseRunConfig(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const CardSort::EngineError& e) {
        spdlog::error("{}", e.what());
        spdlog::error("Usage: {} <bubble|selection|quick|merge> [size 1-{}] [slow|medium|fast] [seed] [--verbose]",
                      argv[0], CardSort::kMaxSize);
        spdlog::info("Example: {} merge 16 fast 42", argv[0]);
        return 1;
    }

    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    spdlog::info("{}", CardSort::algorithmSummary(config.algorithm));
    spdlog::info("Speed: {} ({} ms per swap).", CardSort::speedLabel(config.speed),
                 CardSort::stepDelay(config.speed).count());

    CardSort::PacedHook renderer(CardSort::stepDelay(config.speed), CardSort::compareDelay(config.speed));
    CardSort::RunController controller(renderer, config.speed);

    try {
        const CardSort::Sequence& cards = controller.generate(config.size, config.seed);
        spdlog::info("Cards generated: {}", formatValues(cards.values()));

        CardSort::RunOutcome outcome = controller.run(config.algorithm);
        if (!outcome.completed()) {
            spdlog::error("Sort failed: {}", outcome.reason);
            return 1;
        }
        spdlog::info("Sorted cards:    {}", formatValues(controller.sequence().values()));
        spdlog::info("{} steps ({} comparisons, {} adjacent swaps).",
                     outcome.steps, outcome.comparisons, outcome.swaps);
    } catch (const CardSort::EngineError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
