#include "sequence.hpp"
#include "engine_error.hpp"

#include <string>
#include <utility> // For std::swap

namespace CardSort {

Sequence::Sequence(const std::vector<int>& values, StepHook& hook, ItemId first_id)
    : hook_(&hook),
      comparisons_(0),
      swaps_(0)
{
    if (values.empty()) {
        throw EngineError(ErrorKind::InvalidInput, "cannot build a sequence from an empty dataset");
    }
    items_.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        items_.push_back({first_id + static_cast<ItemId>(i), values[i]});
    }
}

const Item& Sequence::at(int index) const {
    checkIndex(index);
    return items_[index];
}

std::vector<int> Sequence::values() const {
    std::vector<int> out;
    out.reserve(items_.size());
    for (const auto& item : items_) {
        out.push_back(item.value);
    }
    return out;
}

std::vector<ItemId> Sequence::ids() const {
    std::vector<ItemId> out;
    out.reserve(items_.size());
    for (const auto& item : items_) {
        out.push_back(item.id);
    }
    return out;
}

int Sequence::compare(int i, int j) {
    checkIndex(i);
    checkIndex(j);
    ++comparisons_;
    awaitHook(StepKind::Compare, i, j);
    int a = items_[i].value;
    int b = items_[j].value;
    return (a > b) - (a < b);
}

void Sequence::swap(int i, int j) {
    checkIndex(i);
    checkIndex(j);
    if (i - j != 1 && j - i != 1) {
        throw EngineError(ErrorKind::InvalidOperation,
                          "swap(" + std::to_string(i) + ", " + std::to_string(j) +
                          ") is not an adjacent transposition");
    }
    std::swap(items_[i], items_[j]);
    ++swaps_;
    awaitHook(StepKind::Swap, i, j);
}

int Sequence::indexOf(ItemId id, int from) const {
    checkIndex(from);
    int n = static_cast<int>(items_.size());
    for (int k = from; k < n; ++k) {
        if (items_[k].id == id) {
            return k;
        }
    }
    throw EngineError(ErrorKind::InvalidOperation,
                      "item " + std::to_string(id) + " not found at or after index " + std::to_string(from));
}

bool Sequence::isSorted() const {
    for (std::size_t k = 1; k < items_.size(); ++k) {
        if (items_[k - 1].value > items_[k].value) {
            return false;
        }
    }
    return true;
}

void Sequence::resetCounters() {
    comparisons_ = 0;
    swaps_ = 0;
}

// Whatever the hook throws, the algorithm sees HookFailure.
void Sequence::awaitHook(StepKind kind, int i, int j) {
    try {
        if (kind == StepKind::Compare) {
            hook_->onCompare(i, j);
        } else {
            hook_->onSwap(i, j);
        }
    } catch (const EngineError& e) {
        if (e.kind() == ErrorKind::HookFailure) {
            throw;
        }
        throw EngineError(ErrorKind::HookFailure, e.what());
    } catch (const std::exception& e) {
        throw EngineError(ErrorKind::HookFailure, e.what());
    } catch (...) {
        throw EngineError(ErrorKind::HookFailure, "renderer hook rejected the step");
    }
}

void Sequence::checkIndex(int index) const {
    if (index < 0 || index >= static_cast<int>(items_.size())) {
        throw EngineError(ErrorKind::InvalidOperation,
                          "index " + std::to_string(index) + " out of range [0, " +
                          std::to_string(items_.size()) + ")");
    }
}

} // namespace CardSort
