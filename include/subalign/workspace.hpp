#pragma once

#include <cstddef>
#include <vector>

namespace subalign {

// Reusable numeric buffers for one merge run. Buffers grow to the largest
// request and keep their capacity, so repeated DTW / HMM passes over long
// tracks do not reallocate.
class Workspace {
  public:
    enum class Slot {
        DtwCost,   // banded accumulated cost
        HmmScore,  // Viterbi log scores
    };

    // Buffer of exactly n floats (contents unspecified).
    std::vector<float> &floats(Slot slot, size_t n) {
        auto &buf = floats_[static_cast<size_t>(slot)];
        buf.resize(n);
        return buf;
    }

    // Integer buffers: band offsets, back pointers.
    std::vector<int> &ints(Slot slot, size_t n) {
        auto &buf = ints_[static_cast<size_t>(slot)];
        buf.resize(n);
        return buf;
    }

    size_t capacity_bytes() const {
        size_t total = 0;
        for (const auto &b : floats_)
            total += b.capacity() * sizeof(float);
        for (const auto &b : ints_)
            total += b.capacity() * sizeof(int);
        return total;
    }

  private:
    static constexpr size_t NUM_SLOTS = 2;
    std::vector<float> floats_[NUM_SLOTS];
    std::vector<int> ints_[NUM_SLOTS];
};

} // namespace subalign
