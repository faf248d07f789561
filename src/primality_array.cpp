// primality_array.cpp
// Allocation, population and extraction for PrimalityArray.

#include "primality_array.hpp"
#include "errors.hpp"
#include <algorithm>

namespace eratos {

PrimalityArray::PrimalityArray(int64_t limit)
    : limit_(limit)
{
    if (limit < 0) throw InvalidBound(limit);
    flags_.assign(static_cast<size_t>(limit) + 1, 0);
}

void PrimalityArray::fill_true() {
    std::fill(flags_.begin(), flags_.end(), 1);
}

PrimalityArray* populate_all_true(PrimalityArray* array) {
    if (array == nullptr) throw MissingArgument("array");
    array->fill_true();
    return array;
}

std::vector<int64_t>* extract_range(int64_t from, int64_t to,
                                    const PrimalityArray* array,
                                    std::vector<int64_t>* into) {
    if (array == nullptr) throw MissingArgument("array");
    if (into == nullptr) throw MissingArgument("into");

    // Never read outside [0, limit]
    from = std::max<int64_t>(from, 0);
    to   = std::min<int64_t>(to, array->limit());

    for (int64_t i = from; i <= to; i++)
        if (array->test(i)) into->push_back(i);

    return into;
}

} // namespace eratos
