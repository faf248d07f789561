// base_sieve.cpp
// Phase 1: single-threaded elimination up to sqrt(n), plus
// the full-range classic sieve used by sequential_sieve.

#include "sieve_phases.hpp"

namespace eratos {

void classic_sieve(PrimalityArray& array, int64_t n) {
    if (n >= 0) array.clear(0);
    if (n >= 1) array.clear(1);

    for (int64_t p = 2; p * p <= n; p++)
        if (array.test(p))
            for (int64_t i = p * p; i <= n; i += p)
                array.clear(i);
}

void modified_base_sieve(PrimalityArray& array, int64_t n) {
    const int64_t sq = isqrt(n);

    if (n >= 0) array.clear(0);
    if (n >= 1) array.clear(1);

    // Even numbers first, so the odd pass can skip p = 2
    for (int64_t i = 4; i <= sq; i += 2)
        array.clear(i);

    for (int64_t p = 3; p <= sq; p += 2)
        if (array.test(p))
            for (int64_t i = p * p; i <= sq; i += p)
                array.clear(i);
}

std::vector<int64_t> base_primes(PrimalityArray& array, int64_t n) {
    populate_all_true(&array);
    modified_base_sieve(array, n);

    std::vector<int64_t> primes;
    extract_range(2, isqrt(n), &array, &primes);
    return primes;
}

std::vector<int64_t> collect_primes(const PrimalityArray& array,
                                    std::vector<int64_t> divisors) {
    const int64_t n = array.limit();
    extract_range(isqrt(n) + 1, n, &array, &divisors);
    return divisors;
}

} // namespace eratos
