#ifndef CARD_SORT_STEP_HOOK_HPP
#define CARD_SORT_STEP_HOOK_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace CardSort {

enum class StepKind { Compare, Swap, Done };

// One engine step as seen by the renderer.
struct StepEvent {
    StepKind kind;
    int i;
    int j;

    bool operator==(const StepEvent& other) const {
        return kind == other.kind && i == other.i && j == other.j;
    }
    bool operator!=(const StepEvent& other) const { return !(*this == other); }
};

std::string toString(const StepEvent& event);

/**
 * @brief Renderer-side callbacks awaited by the engine.
 *
 * onCompare and onSwap block until the visualization of the step is done;
 * returning acknowledges the step. Throwing rejects it and aborts the run.
 * onComplete is a notification only.
 */
class StepHook {
public:
    virtual ~StepHook() = default;

    virtual void onCompare(int i, int j) = 0;
    virtual void onSwap(int i, int j) = 0;
    virtual void onComplete() = 0;
};

/**
 * @brief Records every step in issue order.
 *
 * Can be told to reject a given step (1-based, counting compares and swaps)
 * to simulate a renderer error.
 */
class TraceRecorder : public StepHook {
public:
    TraceRecorder();

    void onCompare(int i, int j) override;
    void onSwap(int i, int j) override;
    void onComplete() override;

    void failOnStep(std::size_t step);
    void clear();

    const std::vector<StepEvent>& events() const { return events_; }
    std::size_t compareCount() const;
    std::size_t swapCount() const;
    bool completed() const;

private:
    void record(StepKind kind, int i, int j);

    std::vector<StepEvent> events_;
    std::size_t steps_;
    std::size_t fail_step_; // 0 = never
};

/**
 * @brief Holds every step for a fixed delay, the way the card renderer
 * waits for its slide animation before acknowledging.
 */
class PacedHook : public StepHook {
public:
    PacedHook(std::chrono::milliseconds swap_delay, std::chrono::milliseconds compare_delay);

    void onCompare(int i, int j) override;
    void onSwap(int i, int j) override;
    void onComplete() override;

    std::chrono::milliseconds swapDelay() const { return swap_delay_; }
    std::chrono::milliseconds compareDelay() const { return compare_delay_; }

private:
    std::chrono::milliseconds swap_delay_;
    std::chrono::milliseconds compare_delay_;
};

} // namespace CardSort

#endif // CARD_SORT_STEP_HOOK_HPP
