// test_strategies.cpp
// Validates all five strategies against known values, a
// trial-division oracle and GMP's primality test.

#include <gmp.h>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include "eratos.hpp"

using namespace eratos;

namespace {

bool all_passed = true;

void report(const std::string& name, bool pass) {
    std::cout << name << ": " << (pass ? "PASS" : "FAIL") << "\n";
    all_passed &= pass;
}

bool is_prime_trial(int64_t n) {
    if (n < 2) return false;
    for (int64_t d = 2; d * d <= n; d++)
        if (n % d == 0) return false;
    return true;
}

void print_primes(const char* label, const std::vector<int64_t>& v) {
    std::cout << "  " << label;
    for (auto p : v) std::cout << p << " ";
    std::cout << "\n";
}

// Small pool keeps the per-call thread start-up cheap
SieveOptions test_options() {
    SieveOptions opt;
    opt.pool_threads = 2;
    return opt;
}

} // namespace

int main() {
    const SieveOptions opt = test_options();

    // -------------------------------------------------------
    // Test 1: Small primes by hand
    // -------------------------------------------------------
    {
        std::vector<int64_t> expected = {2,3,5,7,11,13,17,19,23,29};
        for (Strategy s : all_strategies()) {
            auto got = run_strategy(s, 30, opt);
            bool pass = (got == expected);
            report(std::string("Test 1 (primes up to 30, ") + strategy_name(s) + ")", pass);
            if (!pass) {
                print_primes("Expected: ", expected);
                print_primes("Got:      ", got);
            }
        }
    }

    // -------------------------------------------------------
    // Test 2: n = 100 gives 25 primes ending at 97
    // -------------------------------------------------------
    for (Strategy s : all_strategies()) {
        auto got = run_strategy(s, 100, opt);
        report(std::string("Test 2 (pi(100) = 25, ") + strategy_name(s) + ")",
               got.size() == 25 && got.back() == 97);
    }

    // -------------------------------------------------------
    // Test 3: boundary bounds
    // -------------------------------------------------------
    for (Strategy s : all_strategies()) {
        bool pass = run_strategy(s, 1, opt).empty()
                 && run_strategy(s, 2, opt) == std::vector<int64_t>({2})
                 && run_strategy(s, 3, opt) == std::vector<int64_t>({2, 3})
                 && run_strategy(s, 4, opt) == std::vector<int64_t>({2, 3});
        report(std::string("Test 3 (n = 1, 2, 3, 4, ") + strategy_name(s) + ")", pass);
    }

    // -------------------------------------------------------
    // Test 4: n <= 0 is rejected by every strategy
    // -------------------------------------------------------
    for (Strategy s : all_strategies()) {
        bool pass = true;
        for (int64_t n : {0LL, -1LL, -1'000'000LL}) {
            try {
                run_strategy(s, n, opt);
                pass = false;
            } catch (const InvalidBound& e) {
                pass &= e.bound() == n;
            }
        }
        report(std::string("Test 4 (invalid bound, ") + strategy_name(s) + ")", pass);
    }

    // -------------------------------------------------------
    // Test 5: every strategy matches trial division
    // for n in [1, 10'000]. The threaded strategies start
    // threads on each call, so they take every n up to 2'000
    // and a stride beyond.
    // -------------------------------------------------------
    {
        const int64_t LIMIT = 10'000;
        std::vector<int64_t> oracle;   // primes <= LIMIT
        for (int64_t k = 2; k <= LIMIT; k++)
            if (is_prime_trial(k)) oracle.push_back(k);

        auto expected_for = [&](int64_t n) {
            std::vector<int64_t> out;
            for (int64_t p : oracle) {
                if (p > n) break;
                out.push_back(p);
            }
            return out;
        };

        for (Strategy s : all_strategies()) {
            bool threaded = s != Strategy::Sequential && s != Strategy::ModifiedSequential;
            bool pass = true;
            for (int64_t n = 1; n <= LIMIT && pass; n += (threaded && n >= 2'000) ? 37 : 1) {
                if (run_strategy(s, n, opt) != expected_for(n)) {
                    std::cout << "  mismatch at n = " << n << "\n";
                    pass = false;
                }
            }
            if (pass) pass = run_strategy(s, LIMIT, opt) == oracle;
            report(std::string("Test 5 (trial-division oracle, ") + strategy_name(s) + ")", pass);
        }
    }

    // -------------------------------------------------------
    // Test 6: Known prime counts (pi(n))
    // -------------------------------------------------------
    struct TestCase { int64_t n; size_t expected; };
    TestCase cases[] = {
        {1'000,         168},
        {10'000,        1'229},
        {100'000,       9'592},
        {1'000'000,     78'498},
    };

    for (auto& [n, expected] : cases) {
        for (Strategy s : all_strategies()) {
            size_t count = run_strategy(s, n, opt).size();
            bool pass = (count == expected);
            std::cout << "pi(" << n << ") = " << count
                      << " expected " << expected
                      << " [" << strategy_name(s) << "]"
                      << (pass ? "  PASS" : "  FAIL") << "\n";
            all_passed &= pass;
        }
    }

    // -------------------------------------------------------
    // Test 7: cross-strategy agreement and GMP check
    // -------------------------------------------------------
    {
        const int64_t N = 300'007;
        auto reference = sequential_sieve(N);

        mpz_t z;
        mpz_init(z);
        bool gmp_pass = true;
        size_t next = 0;
        for (int64_t k = 0; k <= N; k++) {
            mpz_set_si(z, k);
            bool listed = next < reference.size() && reference[next] == k;
            if (listed != (mpz_probab_prime_p(z, 25) > 0)) {
                std::cout << "  GMP disagrees at " << k << "\n";
                gmp_pass = false;
                break;
            }
            if (listed) next++;
        }
        mpz_clear(z);
        report("Test 7a (sequential sieve matches GMP up to 300007)", gmp_pass);

        for (Strategy s : all_strategies()) {
            bool pass = run_strategy(s, N, opt) == reference;
            report(std::string("Test 7b (agrees with sequential, ") + strategy_name(s) + ")", pass);
        }
    }

    // -------------------------------------------------------
    // Test 8: worker counts other than 3
    // -------------------------------------------------------
    {
        auto reference = sequential_sieve(50'000);
        bool pass = true;
        for (unsigned w : {1u, 2u, 4u, 7u, 16u, 300u}) {
            SieveOptions o = opt;
            o.worker_count = w;
            pass &= range_partitioned_sieve(50'000, o) == reference;
            pass &= divisor_partitioned_sieve(50'000, o) == reference;
        }
        for (unsigned t : {1u, 3u, 8u}) {
            SieveOptions o;
            o.pool_threads = t;
            pass &= pool_signaled_sieve(50'000, o) == reference;
        }
        report("Test 8 (configurable worker and pool sizes)", pass);
    }

    // -------------------------------------------------------
    // Test 9: invalid options
    // -------------------------------------------------------
    {
        SieveOptions zero_workers;
        zero_workers.worker_count = 0;
        SieveOptions negative_timeout;
        negative_timeout.timeout = std::chrono::milliseconds(-5);

        bool pass = true;
        for (const SieveOptions* o : {&zero_workers, &negative_timeout}) {
            for (Strategy s : {Strategy::RangePartitioned, Strategy::DivisorPartitioned,
                               Strategy::PoolSignaled}) {
                try {
                    run_strategy(s, 100, *o);
                    pass = false;
                } catch (const InvalidBound&) {
                    pass = false;
                } catch (const std::invalid_argument&) {
                }
            }
        }

        // The bound is checked before the options
        try {
            range_partitioned_sieve(0, zero_workers);
            pass = false;
        } catch (const InvalidBound&) {
        }
        report("Test 9 (invalid options rejected)", pass);
    }

    // -------------------------------------------------------
    // Test 10: names round-trip
    // -------------------------------------------------------
    {
        bool pass = all_strategies().size() == 5;
        for (Strategy s : all_strategies()) {
            Strategy back = Strategy::Sequential;
            pass &= parse_strategy(strategy_name(s), back) && back == s;
        }
        Strategy unused = Strategy::Sequential;
        pass &= !parse_strategy("quantum", unused);
        report("Test 10 (strategy names)", pass);
    }

    std::cout << "\n" << (all_passed ? "All tests passed." : "SOME TESTS FAILED.") << "\n";
    return all_passed ? 0 : 1;
}
