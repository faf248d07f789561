// strategy.cpp
// Option validation and name-based dispatch.

#include "eratos.hpp"
#include <stdexcept>

namespace eratos {

void validate_options(const SieveOptions& options) {
    if (options.worker_count == 0)
        throw std::invalid_argument("worker_count must be >= 1");
    if (options.timeout.count() < 0)
        throw std::invalid_argument("timeout must not be negative");
}

const std::vector<Strategy>& all_strategies() {
    static const std::vector<Strategy> all = {
        Strategy::Sequential,
        Strategy::ModifiedSequential,
        Strategy::RangePartitioned,
        Strategy::DivisorPartitioned,
        Strategy::PoolSignaled,
    };
    return all;
}

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::Sequential:         return "sequential";
        case Strategy::ModifiedSequential: return "modified";
        case Strategy::RangePartitioned:   return "range";
        case Strategy::DivisorPartitioned: return "divisor";
        case Strategy::PoolSignaled:       return "pool";
    }
    return "unknown";
}

bool parse_strategy(const std::string& name, Strategy& out) {
    for (Strategy s : all_strategies()) {
        if (name == strategy_name(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

std::vector<int64_t> run_strategy(Strategy s, int64_t n, const SieveOptions& options) {
    switch (s) {
        case Strategy::Sequential:         return sequential_sieve(n);
        case Strategy::ModifiedSequential: return modified_sequential_sieve(n);
        case Strategy::RangePartitioned:   return range_partitioned_sieve(n, options);
        case Strategy::DivisorPartitioned: return divisor_partitioned_sieve(n, options);
        case Strategy::PoolSignaled:       return pool_signaled_sieve(n, options);
    }
    throw std::invalid_argument("unknown strategy");
}

} // namespace eratos
