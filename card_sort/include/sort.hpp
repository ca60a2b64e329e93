#ifndef CARD_SORT_SORT_HPP
#define CARD_SORT_SORT_HPP

#include <string>

#include "sequence.hpp"

namespace CardSort {

enum class Algorithm { Bubble, Selection, Quick, Merge };

// Bubble Sort
// Compares: exactly n(n-1)/2, Swaps: one per inversion, Stable: yes
void bubbleSort(Sequence& seq);

// Selection Sort
// Compares: exactly n(n-1)/2, at most n-1 exchanges, Stable: no
void selectionSort(Sequence& seq);

// Quick Sort (Lomuto, last element pivot)
// Time Complexity: O(n log n) average, O(n^2) worst, Stable: no
void quickSort(Sequence& seq);

// Merge Sort, merging by relocation
// Compares: O(n log n), adjacent swaps: O(n^2 log n) worst, Stable: yes
void mergeSort(Sequence& seq);

// Dispatches to one of the four sorts above.
void runAlgorithm(Algorithm algorithm, Sequence& seq);

/**
 * @brief Parses "bubble", "selection", "quick" or "merge" (case-insensitive).
 * @throws EngineError(InvalidInput) for any other name.
 */
Algorithm parseAlgorithm(const std::string& name);

const char* algorithmName(Algorithm algorithm);

// Sidebar text: idea, complexities, stability.
const char* algorithmSummary(Algorithm algorithm);

bool isStable(Algorithm algorithm);

} // namespace CardSort

#endif // CARD_SORT_SORT_HPP
