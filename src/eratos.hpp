// eratos.hpp
// Public interface: five interchangeable ways to list every
// prime <= n. All of them return the primes in ascending
// order and agree exactly for every n >= 1.
//
//   sequential_sieve            classic Eratosthenes over 2..n
//   modified_sequential_sieve   base primes to sqrt(n), then
//                               trial division of the rest
//   range_partitioned_sieve     upper range split into
//                               contiguous slices, one thread each
//   divisor_partitioned_sieve   base primes split into classes,
//                               one thread each
//   pool_signaled_sieve         one pool task per base prime,
//                               countdown latch for completion
//
// Every strategy throws InvalidBound for n <= 0 before any
// allocation.

#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"
#include "primality_array.hpp"

namespace eratos {

// -------------------------------------------------------
// Tuning for the concurrent strategies
// -------------------------------------------------------
struct SieveOptions {
    // Threads used by the range- and divisor-partitioned
    // strategies. Must be >= 1.
    unsigned worker_count = 3;

    // Longest the driver waits for its workers. Zero waits
    // unconditionally. On expiry workers are stopped and
    // SieveTimeout is thrown.
    std::chrono::milliseconds timeout{0};

    // Threads in the pool used by pool_signaled_sieve.
    // Zero means default_pool_threads().
    unsigned pool_threads = 0;
};

// Throws std::invalid_argument for worker_count == 0 or a
// negative timeout.
void validate_options(const SieveOptions& options);

std::vector<int64_t> sequential_sieve(int64_t n);
std::vector<int64_t> modified_sequential_sieve(int64_t n);
std::vector<int64_t> range_partitioned_sieve(int64_t n, const SieveOptions& options = {});
std::vector<int64_t> divisor_partitioned_sieve(int64_t n, const SieveOptions& options = {});
std::vector<int64_t> pool_signaled_sieve(int64_t n, const SieveOptions& options = {});

// -------------------------------------------------------
// Dispatch by name
// -------------------------------------------------------
enum class Strategy {
    Sequential,
    ModifiedSequential,
    RangePartitioned,
    DivisorPartitioned,
    PoolSignaled,
};

const std::vector<Strategy>& all_strategies();

// Short command-line name, e.g. "range".
const char* strategy_name(Strategy s);

// Inverse of strategy_name. Returns false for unknown names.
bool parse_strategy(const std::string& name, Strategy& out);

std::vector<int64_t> run_strategy(Strategy s, int64_t n,
                                  const SieveOptions& options = {});

} // namespace eratos
