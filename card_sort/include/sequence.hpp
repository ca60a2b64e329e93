#ifndef CARD_SORT_SEQUENCE_HPP
#define CARD_SORT_SEQUENCE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "step_hook.hpp"

namespace CardSort {

using ItemId = std::uint32_t;

// A card: stable identity plus an immutable value. Only its position changes.
struct Item {
    ItemId id;
    int value;
};

/**
 * @brief Ordered items being sorted. Mutated only through adjacent swaps.
 *
 * Every compare and swap is reported to the hook and does not return until the
 * hook does. Out-of-range or non-adjacent requests throw InvalidOperation
 * before anything changes.
 */
class Sequence {
public:
    /**
     * @brief Builds items from values, assigning ids first_id, first_id+1, ...
     * @throws EngineError(InvalidInput) if values is empty.
     */
    Sequence(const std::vector<int>& values, StepHook& hook, ItemId first_id = 0);

    std::size_t size() const { return items_.size(); }

    const Item& at(int index) const;
    int valueAt(int index) const { return at(index).value; }

    const std::vector<Item>& items() const { return items_; }
    std::vector<int> values() const;
    std::vector<ItemId> ids() const;

    /**
     * @brief Reports a comparison to the hook and returns the three-way result
     * of value[i] against value[j] (-1, 0, 1).
     */
    int compare(int i, int j);

    /**
     * @brief Exchanges two neighbouring items, then waits for the hook.
     * @throws EngineError(InvalidOperation) unless |i - j| == 1 and both in range.
     */
    void swap(int i, int j);

    /**
     * @brief Current position of the item with the given id, scanning from `from`.
     * @throws EngineError(InvalidOperation) if the id is not at or after `from`.
     */
    int indexOf(ItemId id, int from = 0) const;

    bool isSorted() const;

    std::uint64_t steps() const { return comparisons_ + swaps_; }
    std::uint64_t comparisons() const { return comparisons_; }
    std::uint64_t swaps() const { return swaps_; }
    void resetCounters();

private:
    void awaitHook(StepKind kind, int i, int j);
    void checkIndex(int index) const;

    std::vector<Item> items_;
    StepHook* hook_;
    std::uint64_t comparisons_;
    std::uint64_t swaps_;
};

} // namespace CardSort

#endif // CARD_SORT_SEQUENCE_HPP
