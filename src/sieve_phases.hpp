// sieve_phases.hpp
// Building blocks shared by the strategies in eratos.hpp.
//
// Every strategy except sequential_sieve runs in two phases:
//   phase 1  find the base primes <= floor(sqrt(n))
//   phase 2  clear composites in (floor(sqrt(n)), n]
// Phase 2 is where the strategies differ. The routines are
// exposed so a prepared array can be driven through one
// phase at a time.

#pragma once
#include <cstdint>
#include <vector>

#include "eratos.hpp"
#include "primality_array.hpp"

namespace eratos {

// -------------------------------------------------------
// Phase 1
// -------------------------------------------------------

// Classic Eratosthenes over 2..n of an armed array:
// for each p with p*p <= n still marked, clear p*p, p*p+p, ...
// Clears 0 and 1.
void classic_sieve(PrimalityArray& array, int64_t n);

// Same marks as classic_sieve, restricted to 2..floor(sqrt(n)):
// evens >= 4 are cleared first, then multiples of the odd
// base primes. Clears 0 and 1. Indices above floor(sqrt(n))
// are not touched.
void modified_base_sieve(PrimalityArray& array, int64_t n);

// Arm `array`, run modified_base_sieve and return the base
// primes <= floor(sqrt(n)) in ascending order.
std::vector<int64_t> base_primes(PrimalityArray& array, int64_t n);

// -------------------------------------------------------
// Phase 2 work descriptors
// -------------------------------------------------------

// Half-open index range [from, to) owned by one worker.
struct Partition {
    int64_t from;
    int64_t to;
};

// Split [start, n] into `workers` contiguous slices of
// (n - start + 1) / workers indices each; the last slice
// ends at n + 1 and absorbs the remainder. Slices may be
// empty when there are fewer indices than workers.
std::vector<Partition> partition_range(int64_t start, int64_t n, unsigned workers);

// Deal `divisors` into `workers` classes: divisors[i] goes to
// class i % workers. Order inside each class is preserved.
std::vector<std::vector<int64_t>> divisor_classes(const std::vector<int64_t>& divisors,
                                                  unsigned workers);

// -------------------------------------------------------
// Phase 2 drivers. Each clears every index in
// (floor(sqrt(n)), n] that has a divisor in `divisors`,
// where n = array.limit(). Concurrent ones block until all
// their workers are done.
// -------------------------------------------------------
void eliminate_sequential(PrimalityArray& array, const std::vector<int64_t>& divisors);

void eliminate_range_partitioned(PrimalityArray& array, const std::vector<int64_t>& divisors,
                                 const SieveOptions& options);

void eliminate_divisor_partitioned(PrimalityArray& array, const std::vector<int64_t>& divisors,
                                   const SieveOptions& options);

void eliminate_pool_signaled(PrimalityArray& array, const std::vector<int64_t>& divisors,
                             const SieveOptions& options);

// Collect the base primes followed by the survivors of
// phase 2: the final result of a two-phase strategy.
std::vector<int64_t> collect_primes(const PrimalityArray& array,
                                    std::vector<int64_t> divisors);

} // namespace eratos
