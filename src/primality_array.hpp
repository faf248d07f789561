// primality_array.hpp
// Flat table of primality flags shared by every sieve strategy.
// One byte per index, so writes to different indices never touch
// the same memory location (unlike std::vector<bool>).
//
// Encoding:
//   flag[i] == 1  →  i is still a prime candidate
//   flag[i] == 0  →  i is known composite (or 0 / 1)
//
// Memory usage: n + 1 bytes for a bound of n
//   10^8  →  ~95 MB
//   10^9  →  ~954 MB

#pragma once
#include <cmath>
#include <cstdint>
#include <mutex>
#include <vector>

namespace eratos {

// -------------------------------------------------------
// Exact floor(sqrt(n)). Same cut-off as (int)std::sqrt(n)
// for every n a PrimalityArray can hold, without relying on
// the rounding of the double result.
// -------------------------------------------------------
inline int64_t isqrt(int64_t n) {
    if (n < 2) return n < 0 ? 0 : n;
    int64_t r = static_cast<int64_t>(std::sqrt(static_cast<double>(n)));
    while (r * r > n) r--;
    while ((r + 1) * (r + 1) <= n) r++;
    return r;
}

// -------------------------------------------------------
// PrimalityArray: flags for indices [0, limit].
// Owned by exactly one sieve call. Fresh arrays start with
// every flag cleared; populate_all_true() arms them.
//
// Mutation is monotone once sieving starts: the only single
// index writes are clear() and clear_locked(), which move a
// flag from 1 to 0 and never back.
// -------------------------------------------------------
class PrimalityArray {
public:
    // Throws InvalidBound if limit < 0.
    explicit PrimalityArray(int64_t limit);

    PrimalityArray(const PrimalityArray&) = delete;
    PrimalityArray& operator=(const PrimalityArray&) = delete;

    // Mark index i composite. Single-threaded callers only.
    void clear(int64_t i) {
        flags_[static_cast<size_t>(i)] = 0;
    }

    // Mark index i composite while holding this array's lock.
    // Used by every worker thread during concurrent elimination.
    void clear_locked(int64_t i) {
        std::lock_guard<std::mutex> lock(mutex_);
        flags_[static_cast<size_t>(i)] = 0;
    }

    // Is index i still a candidate?
    bool test(int64_t i) const {
        return flags_[static_cast<size_t>(i)] != 0;
    }

    // Arm every flag. Prefer populate_all_true(), which also
    // validates its argument.
    void fill_true();

    // -------------------------------------------------------
    // Accessors
    // -------------------------------------------------------
    int64_t limit() const { return limit_; }
    int64_t size()  const { return static_cast<int64_t>(flags_.size()); }

    // Copy of the raw flags, for comparing states before and
    // after a sieve phase.
    std::vector<char> snapshot() const { return flags_; }

private:
    int64_t limit_;
    std::vector<char> flags_;
    std::mutex mutex_;
};

// -------------------------------------------------------
// Shared helpers
// -------------------------------------------------------

// Set every slot of `array` to "still prime" and return it.
// Throws MissingArgument if array is null.
PrimalityArray* populate_all_true(PrimalityArray* array);

// Append every index in [from, to] still marked in `array`
// to `into`, in ascending order, and return `into`.
// from > to is an empty range. Indices past the end of the
// array are ignored.
// Throws MissingArgument if array or into is null.
std::vector<int64_t>* extract_range(int64_t from, int64_t to,
                                    const PrimalityArray* array,
                                    std::vector<int64_t>* into);

} // namespace eratos
