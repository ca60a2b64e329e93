#include "move_decomposer.hpp"

#include <algorithm>

namespace CardSort {

void relocate(Sequence& seq, int from, int to) {
    // Both ends are checked before the first swap.
    seq.at(from);
    seq.at(to);

    if (from < to) {
        for (int k = from; k < to; ++k) {
            seq.swap(k, k + 1);
        }
    } else {
        for (int k = from; k > to; --k) {
            seq.swap(k, k - 1);
        }
    }
}

void exchange(Sequence& seq, int i, int j) {
    seq.at(i);
    seq.at(j);

    if (i == j) {
        return;
    }
    if (i - j == 1 || j - i == 1) {
        seq.swap(i, j);
        return;
    }
    int lo = std::min(i, j);
    int hi = std::max(i, j);
    relocate(seq, lo, hi);     // [lo] goes to hi, (lo, hi] shift down
    relocate(seq, hi - 1, lo); // former [hi] now sits at hi-1
}

} // namespace CardSort
