#include "step_hook.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

namespace CardSort {

std::string toString(const StepEvent& event) {
    switch (event.kind) {
        case StepKind::Compare:
            return "Compare(" + std::to_string(event.i) + "," + std::to_string(event.j) + ")";
        case StepKind::Swap:
            return "Swap(" + std::to_string(event.i) + "," + std::to_string(event.j) + ")";
        case StepKind::Done:
            return "Done";
    }
    return "?";
}

// --- TraceRecorder ---

TraceRecorder::TraceRecorder()
    : steps_(0),
      fail_step_(0)
{
}

void TraceRecorder::onCompare(int i, int j) {
    record(StepKind::Compare, i, j);
}

void TraceRecorder::onSwap(int i, int j) {
    record(StepKind::Swap, i, j);
}

void TraceRecorder::onComplete() {
    events_.push_back({StepKind::Done, -1, -1});
}

void TraceRecorder::failOnStep(std::size_t step) {
    fail_step_ = step;
}

void TraceRecorder::clear() {
    events_.clear();
    steps_ = 0;
}

std::size_t TraceRecorder::compareCount() const {
    return std::count_if(events_.begin(), events_.end(),
                         [](const StepEvent& e) { return e.kind == StepKind::Compare; });
}

std::size_t TraceRecorder::swapCount() const {
    return std::count_if(events_.begin(), events_.end(),
                         [](const StepEvent& e) { return e.kind == StepKind::Swap; });
}

bool TraceRecorder::completed() const {
    return !events_.empty() && events_.back().kind == StepKind::Done;
}

void TraceRecorder::record(StepKind kind, int i, int j) {
    ++steps_;
    if (fail_step_ != 0 && steps_ == fail_step_) {
        throw std::runtime_error("renderer rejected step " + std::to_string(steps_));
    }
    events_.push_back({kind, i, j});
}

// --- PacedHook ---

PacedHook::PacedHook(std::chrono::milliseconds swap_delay, std::chrono::milliseconds compare_delay)
    : swap_delay_(swap_delay),
      compare_delay_(compare_delay)
{
}

void PacedHook::onCompare(int i, int j) {
    spdlog::debug("compare [{}] <-> [{}]", i, j);
    std::this_thread::sleep_for(compare_delay_);
}

void PacedHook::onSwap(int i, int j) {
    spdlog::debug("swap    [{}] <-> [{}]", i, j);
    std::this_thread::sleep_for(swap_delay_);
}

void PacedHook::onComplete() {
    spdlog::info("Renderer: all cards in place.");
}

} // namespace CardSort
