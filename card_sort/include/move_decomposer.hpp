#ifndef CARD_SORT_MOVE_DECOMPOSER_HPP
#define CARD_SORT_MOVE_DECOMPOSER_HPP

#include "sequence.hpp"

namespace CardSort {

/**
 * @brief Moves the item at `from` to `to` through a chain of adjacent swaps.
 *
 * Items strictly between the two positions shift by one toward `from`; every
 * other item keeps its place. No-op when from == to.
 * @throws EngineError(InvalidOperation) if either index is out of range.
 */
void relocate(Sequence& seq, int from, int to);

/**
 * @brief Exchanges the items at i and j, leaving everything else in place.
 *
 * Neighbours take one swap. Distant positions are done as two relocations:
 * the lower item travels up to the higher slot, then the displaced item
 * travels back down.
 */
void exchange(Sequence& seq, int i, int j);

} // namespace CardSort

#endif // CARD_SORT_MOVE_DECOMPOSER_HPP
