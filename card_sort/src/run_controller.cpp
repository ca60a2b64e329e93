#include "run_controller.hpp"
#include "engine_error.hpp"
#include "run_config.hpp"

#include <spdlog/spdlog.h>

namespace CardSort {

const char* runStateName(RunState state) {
    switch (state) {
        case RunState::Idle:      return "Idle";
        case RunState::Running:   return "Running";
        case RunState::Completed: return "Completed";
        case RunState::Failed:    return "Failed";
    }
    return "Unknown";
}

namespace {

// Clears the running flag on every exit path; anything that escapes the run
// without setting a final state leaves it Failed.
class RunningGuard {
public:
    RunningGuard(bool& running, RunState& state)
        : running_(running), state_(state)
    {
        running_ = true;
        state_ = RunState::Running;
    }

    ~RunningGuard() {
        running_ = false;
        if (state_ == RunState::Running) {
            state_ = RunState::Failed;
        }
    }

    RunningGuard(const RunningGuard&) = delete;
    RunningGuard& operator=(const RunningGuard&) = delete;

private:
    bool& running_;
    RunState& state_;
};

} // namespace

RunController::RunController(StepHook& hook, Speed speed)
    : hook_(hook),
      next_id_(0),
      speed_(speed),
      running_(false),
      state_(RunState::Idle)
{
}

const Sequence& RunController::initialize(const std::vector<int>& values) {
    rejectIfRunning("initialize");
    if (values.size() > static_cast<std::size_t>(kMaxSize)) {
        throw EngineError(ErrorKind::InvalidInput,
                          "dataset of " + std::to_string(values.size()) + " items exceeds the limit of " +
                          std::to_string(kMaxSize));
    }
    // A rejected dataset leaves the current one in place.
    auto fresh = std::make_unique<Sequence>(values, hook_, next_id_);
    next_id_ += static_cast<ItemId>(values.size());
    sequence_ = std::move(fresh);
    state_ = RunState::Idle;
    spdlog::info("Dataset initialized with {} items.", sequence_->size());
    return *sequence_;
}

const Sequence& RunController::generate(int size, std::uint32_t seed) {
    rejectIfRunning("generate");
    return initialize(generateValues(size, seed));
}

void RunController::reset() {
    rejectIfRunning("reset");
    sequence_.reset();
    state_ = RunState::Idle;
    spdlog::info("Reset. Generate a dataset to begin.");
}

void RunController::setSpeed(Speed speed) {
    rejectIfRunning("speed change");
    speed_ = speed;
}

RunOutcome RunController::run(const std::string& algorithm_name) {
    rejectIfRunning("run");
    return run(parseAlgorithm(algorithm_name));
}

RunOutcome RunController::run(Algorithm algorithm) {
    rejectIfRunning("run");
    if (!sequence_) {
        spdlog::warn("Rejected run: no dataset has been generated.");
        throw EngineError(ErrorKind::EmptySequence, "no dataset to sort");
    }

    RunOutcome outcome{RunState::Running, algorithm, speed_, sequence_->size(), 0, 0, 0, ""};
    {
        RunningGuard guard(running_, state_);
        sequence_->resetCounters();
        spdlog::info("Sorting {} items with {} sort at {} speed...",
                     sequence_->size(), algorithmName(algorithm), speedLabel(speed_));
        try {
            runAlgorithm(algorithm, *sequence_);
            state_ = RunState::Completed;
        } catch (const EngineError& e) {
            state_ = RunState::Failed;
            outcome.reason = e.what();
            spdlog::error("Sort aborted after {} steps: {}", sequence_->steps(), e.what());
        }
    }

    outcome.state = state_;
    outcome.steps = sequence_->steps();
    outcome.comparisons = sequence_->comparisons();
    outcome.swaps = sequence_->swaps();

    if (outcome.completed()) {
        spdlog::info("Finished {} sort: {} comparisons, {} swaps.",
                     algorithmName(algorithm), outcome.comparisons, outcome.swaps);
        try {
            hook_.onComplete();
        } catch (const std::exception& e) {
            // Completion is a notification; the run result already stands.
            spdlog::warn("Completion hook failed: {}", e.what());
        } catch (...) {
            spdlog::warn("Completion hook failed with a non-standard exception.");
        }
    }
    return outcome;
}

const Sequence& RunController::sequence() const {
    if (!sequence_) {
        throw EngineError(ErrorKind::EmptySequence, "no dataset has been generated");
    }
    return *sequence_;
}

void RunController::rejectIfRunning(const char* request) const {
    if (running_) {
        spdlog::warn("Rejected {}: a sort is in progress.", request);
        throw EngineError(ErrorKind::AlreadyRunning, std::string(request) + " requested while a sort is running");
    }
}

} // namespace CardSort
