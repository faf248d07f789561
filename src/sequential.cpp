// sequential.cpp
// The two single-threaded strategies. sequential_sieve is the
// reference every other strategy is checked against.

#include "eratos.hpp"
#include "sieve_phases.hpp"
#include <utility>

namespace eratos {

// -------------------------------------------------------
// Trial division of (floor(sqrt(n)), n] by the base primes,
// smallest first, stopping at the first divisor found.
// -------------------------------------------------------
void eliminate_sequential(PrimalityArray& array, const std::vector<int64_t>& divisors) {
    const int64_t n = array.limit();

    for (int64_t i = isqrt(n) + 1; i <= n; i++) {
        for (int64_t p : divisors) {
            if (i % p == 0) {
                array.clear(i);
                break;
            }
        }
    }
}

std::vector<int64_t> sequential_sieve(int64_t n) {
    validate_bound(n);

    PrimalityArray array(n);
    populate_all_true(&array);
    classic_sieve(array, n);

    std::vector<int64_t> primes;
    extract_range(2, n, &array, &primes);
    return primes;
}

std::vector<int64_t> modified_sequential_sieve(int64_t n) {
    validate_bound(n);

    PrimalityArray array(n);
    std::vector<int64_t> divisors = base_primes(array, n);
    eliminate_sequential(array, divisors);
    return collect_primes(array, std::move(divisors));
}

} // namespace eratos
