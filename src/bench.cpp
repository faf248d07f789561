// bench.cpp
// Runs the sieve strategies for one bound and reports timing.
// Uses GMP's Miller-Rabin test to independently check the
// top of the result when --verify is given.
//
// Usage:
//   ./eratos_bench                                 (n = 10^7, all strategies)
//   ./eratos_bench N [strategy|all] [workers] [timeout_ms] [--verify] [--print]
//
// strategy: sequential, modified, range, divisor, pool

#include <gmp.h>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "eratos.hpp"
#include "thread_pool.hpp"

using namespace eratos;

namespace {

// -------------------------------------------------------
// Check the last `tail` primes of `primes` with GMP: every
// listed value must be a probable prime, and every value
// between them that is not listed must be composite.
// -------------------------------------------------------
bool gmp_check_tail(const std::vector<int64_t>& primes, int64_t n, size_t tail) {
    if (primes.empty()) return n < 2;

    size_t first = primes.size() > tail ? primes.size() - tail : 0;
    size_t next = first;

    mpz_t z;
    mpz_init(z);

    bool ok = true;
    for (int64_t k = primes[first]; k <= n && ok; k++) {
        mpz_set_si(z, k);
        bool listed = next < primes.size() && primes[next] == k;
        bool probable = mpz_probab_prime_p(z, 25) > 0;
        if (listed != probable) {
            std::cerr << "GMP disagrees at " << k
                      << (listed ? " (listed, composite)\n" : " (missing, prime)\n");
            ok = false;
        }
        if (listed) next++;
    }

    mpz_clear(z);
    return ok;
}

bool parse_int(const std::string& s, int64_t& out) {
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int usage() {
    std::cerr << "Usage: eratos_bench [N] [sequential|modified|range|divisor|pool|all]"
                 " [workers] [timeout_ms] [--verify] [--print]\n";
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    // -------------------------------------------------------
    // Configuration: defaults, overridden by arguments
    // -------------------------------------------------------
    int64_t n = 10'000'000;
    std::string which = "all";
    SieveOptions options;
    bool verify = false;
    bool print = false;
    const size_t GMP_TAIL = 1'000;   // primes re-checked with GMP

    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verify")     verify = true;
        else if (arg == "--print") print = true;
        else if (arg == "--help" || arg == "-h") return usage();
        else positional.push_back(arg);
    }

    if (positional.size() > 4) return usage();
    if (positional.size() > 0 && !parse_int(positional[0], n)) return usage();
    if (positional.size() > 1) which = positional[1];
    if (positional.size() > 2) {
        int64_t w = 0;
        if (!parse_int(positional[2], w) || w < 1) return usage();
        options.worker_count = static_cast<unsigned>(w);
    }
    if (positional.size() > 3) {
        int64_t ms = 0;
        if (!parse_int(positional[3], ms) || ms < 0) return usage();
        options.timeout = std::chrono::milliseconds(ms);
    }

    std::vector<Strategy> selected;
    if (which == "all") {
        selected = all_strategies();
    } else {
        Strategy s;
        if (!parse_strategy(which, s)) {
            std::cerr << "Error: unknown strategy '" << which << "'\n";
            return usage();
        }
        selected.push_back(s);
    }

    std::cout << "Listing primes up to " << n << "\n";
    std::cout << "Workers      : " << options.worker_count << "\n";
    std::cout << "Pool threads : " << default_pool_threads() << "\n";
    if (options.timeout.count() > 0)
        std::cout << "Timeout      : " << options.timeout.count() << " ms\n";
    std::cout << "\n";

    try {
        std::vector<int64_t> reference;
        if (verify) {
            std::cout << "Building reference with sequential sieve...\n";
            reference = sequential_sieve(n);
            if (!gmp_check_tail(reference, n, GMP_TAIL)) {
                std::cout << "FAIL: reference rejected by GMP\n";
                return 1;
            }
        }

        uint64_t failures = 0;
        std::cout << "--- Summary ---\n";
        for (Strategy s : selected) {
            auto t0 = std::chrono::high_resolution_clock::now();
            std::vector<int64_t> primes = run_strategy(s, n, options);
            auto t1 = std::chrono::high_resolution_clock::now();
            double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

            std::cout << strategy_name(s) << "\n"
                      << "  primes  : " << primes.size() << "\n"
                      << "  largest : " << (primes.empty() ? 0 : primes.back()) << "\n"
                      << "  time    : " << ms << " ms\n";

            if (verify) {
                bool pass = (primes == reference);
                std::cout << "  verify  : " << (pass ? "PASS" : "FAIL") << "\n";
                if (!pass) failures++;
            }

            if (print) {
                for (int64_t p : primes) std::cout << p << "\n";
            }
        }

        if (verify && failures == 0)
            std::cout << "\nAll strategies agree up to " << n << ". ✓\n";

        return (failures == 0) ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
