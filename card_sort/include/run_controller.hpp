#ifndef CARD_SORT_RUN_CONTROLLER_HPP
#define CARD_SORT_RUN_CONTROLLER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "run_config.hpp"
#include "sequence.hpp"
#include "sort.hpp"
#include "step_hook.hpp"

namespace CardSort {

enum class RunState { Idle, Running, Completed, Failed };

const char* runStateName(RunState state);

// What a finished run reports back.
struct RunOutcome {
    RunState state;
    Algorithm algorithm;
    Speed speed;
    std::size_t size;
    std::uint64_t steps;
    std::uint64_t comparisons;
    std::uint64_t swaps;
    std::string reason; // empty unless Failed

    bool completed() const { return state == RunState::Completed; }
};

/**
 * @brief One sorting session: owns the current Sequence and runs one
 * algorithm over it at a time.
 *
 * While a run is in progress (that is, from inside a hook callback) every
 * request that would touch the Sequence throws AlreadyRunning.
 */
class RunController {
public:
    explicit RunController(StepHook& hook, Speed speed = Speed::Medium);

    // Non-copyable: the sequence points at our hook.
    RunController(const RunController&) = delete;
    RunController& operator=(const RunController&) = delete;

    /**
     * @brief Replaces the dataset with items built from values.
     * @throws EngineError(AlreadyRunning) during a run,
     *         EngineError(InvalidInput) if values is empty or longer than kMaxSize.
     */
    const Sequence& initialize(const std::vector<int>& values);

    /**
     * @brief Replaces the dataset with `size` fresh distinct values.
     * @param seed 0 for a random seed.
     */
    const Sequence& generate(int size, std::uint32_t seed = 0);

    /**
     * @brief Drops the dataset and returns to Idle.
     * @throws EngineError(AlreadyRunning) during a run.
     */
    void reset();

    /**
     * @brief Sorts the current dataset with the given algorithm.
     *
     * Hook failures end the run as Failed and are reported in the outcome.
     * @throws EngineError(AlreadyRunning) if a run is in progress,
     *         EngineError(EmptySequence) if there is no dataset.
     */
    RunOutcome run(Algorithm algorithm);
    RunOutcome run(const std::string& algorithm_name);

    /**
     * @brief Speed recorded with each run; the hook does the actual pacing.
     * @throws EngineError(AlreadyRunning) during a run.
     */
    void setSpeed(Speed speed);
    Speed speed() const { return speed_; }

    bool isRunning() const { return running_; }
    RunState state() const { return state_; }
    bool hasSequence() const { return static_cast<bool>(sequence_); }

    // @throws EngineError(EmptySequence) if there is no dataset.
    const Sequence& sequence() const;

private:
    void rejectIfRunning(const char* request) const;

    StepHook& hook_;
    std::unique_ptr<Sequence> sequence_;
    ItemId next_id_;
    Speed speed_;
    bool running_;
    RunState state_;
};

} // namespace CardSort

#endif // CARD_SORT_RUN_CONTROLLER_HPP
