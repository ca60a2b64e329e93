#include "sort.hpp"
#include "engine_error.hpp"
#include "move_decomposer.hpp"

#include <algorithm> // For std::transform
#include <cctype>
#include <vector>

namespace CardSort {

// --- Bubble Sort ---
void bubbleSort(Sequence& seq) {
    int n = static_cast<int>(seq.size());
    for (int i = 0; i < n - 1; ++i) {
        for (int j = 0; j < n - i - 1; ++j) {
            if (seq.compare(j, j + 1) > 0) {
                seq.swap(j, j + 1);
            }
        }
    }
}

// --- Selection Sort ---
void selectionSort(Sequence& seq) {
    int n = static_cast<int>(seq.size());
    for (int i = 0; i < n - 1; ++i) {
        int min_idx = i;
        for (int j = i + 1; j < n; ++j) {
            if (seq.compare(min_idx, j) > 0) {
                min_idx = j;
            }
        }
        if (min_idx != i) {
            exchange(seq, i, min_idx);
        }
    }
}

// --- Quick Sort ---
// Private helper: Lomuto partition around seq[high], returns the pivot's final slot
int partition(Sequence& seq, int low, int high) {
    int i = low - 1;
    for (int j = low; j < high; ++j) {
        if (seq.compare(j, high) <= 0) {
            ++i;
            exchange(seq, i, j);
        }
    }
    exchange(seq, i + 1, high);
    return i + 1;
}

void quickSort_recursive(Sequence& seq, int low, int high) {
    if (low < high) {
        int p = partition(seq, low, high);
        quickSort_recursive(seq, low, p - 1);
        quickSort_recursive(seq, p + 1, high);
    }
}

void quickSort(Sequence& seq) {
    quickSort_recursive(seq, 0, static_cast<int>(seq.size()) - 1);
}

// --- Merge Sort ---
// Private helper: merges [left, mid] and [mid+1, right] in place.
// The halves are remembered by item id, so duplicate values stay unambiguous.
void merge(Sequence& seq, int left, int mid, int right) {
    std::vector<ItemId> left_ids;
    std::vector<ItemId> right_ids;
    for (int k = left; k <= mid; ++k) {
        left_ids.push_back(seq.at(k).id);
    }
    for (int k = mid + 1; k <= right; ++k) {
        right_ids.push_back(seq.at(k).id);
    }

    std::size_t i = 0, j = 0;
    int k = left;
    while (i < left_ids.size() && j < right_ids.size()) {
        int idx_left = seq.indexOf(left_ids[i], left);
        int idx_right = seq.indexOf(right_ids[j], left);
        // Ties take the left candidate.
        if (seq.compare(idx_left, idx_right) <= 0) {
            relocate(seq, idx_left, k);
            ++i;
        } else {
            relocate(seq, idx_right, k);
            ++j;
        }
        ++k;
    }
    while (i < left_ids.size()) {
        relocate(seq, seq.indexOf(left_ids[i++], left), k++);
    }
    while (j < right_ids.size()) {
        relocate(seq, seq.indexOf(right_ids[j++], left), k++);
    }
}

void mergeSort_recursive(Sequence& seq, int left, int right) {
    if (left < right) {
        int mid = (left + right) / 2;
        mergeSort_recursive(seq, left, mid);
        mergeSort_recursive(seq, mid + 1, right);
        merge(seq, left, mid, right);
    }
}

void mergeSort(Sequence& seq) {
    mergeSort_recursive(seq, 0, static_cast<int>(seq.size()) - 1);
}

// --- Dispatch / metadata ---
void runAlgorithm(Algorithm algorithm, Sequence& seq) {
    switch (algorithm) {
        case Algorithm::Bubble:    bubbleSort(seq); return;
        case Algorithm::Selection: selectionSort(seq); return;
        case Algorithm::Quick:     quickSort(seq); return;
        case Algorithm::Merge:     mergeSort(seq); return;
    }
    throw EngineError(ErrorKind::InvalidInput, "unknown algorithm");
}

Algorithm parseAlgorithm(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "bubble") return Algorithm::Bubble;
    if (lower == "selection") return Algorithm::Selection;
    if (lower == "quick") return Algorithm::Quick;
    if (lower == "merge") return Algorithm::Merge;
    throw EngineError(ErrorKind::InvalidInput,
                      "unknown algorithm '" + name + "' (expected bubble, selection, quick or merge)");
}

const char* algorithmName(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::Bubble:    return "bubble";
        case Algorithm::Selection: return "selection";
        case Algorithm::Quick:     return "quick";
        case Algorithm::Merge:     return "merge";
    }
    return "unknown";
}

const char* algorithmSummary(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::Bubble:
            return "Bubble Sort: adjacent comparisons and swaps; largest elements bubble to the end. "
                   "Best: O(n), Avg/Worst: O(n^2), Stable: yes.";
        case Algorithm::Selection:
            return "Selection Sort: selects the smallest remaining element and places it next. "
                   "Best/Avg/Worst: O(n^2), Stable: no.";
        case Algorithm::Quick:
            return "Quick Sort: partition around a pivot; recursively sort partitions. "
                   "Best/Avg: O(n log n), Worst: O(n^2), Stable: no.";
        case Algorithm::Merge:
            return "Merge Sort: divide and conquer with stable merging. "
                   "Best/Avg/Worst: O(n log n), Stable: yes.";
    }
    return "";
}

bool isStable(Algorithm algorithm) {
    return algorithm == Algorithm::Bubble || algorithm == Algorithm::Merge;
}

} // namespace CardSort
