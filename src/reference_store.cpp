#include "reference_store.hpp"

#include "oracle_error.hpp"

#include <sstream>

namespace sr {

void ReferenceStore::applyBatch(const std::vector<std::string>& symbols,
                                const std::vector<std::uint64_t>& rates,
                                const std::vector<std::uint64_t>& resolveTimes,
                                const std::vector<std::uint64_t>& requestIds) {
    const std::size_t len = symbols.size();
    if (rates.size() != len || resolveTimes.size() != len || requestIds.size() != len) {
        std::ostringstream oss;
        oss << "relay batch arrays differ in length (symbols=" << len
            << ", rates=" << rates.size() << ", resolve_times=" << resolveTimes.size()
            << ", request_ids=" << requestIds.size() << ")";
        throw OracleError(OracleErrc::MismatchedBatchLength, oss.str());
    }

    for (std::size_t i = 0; i < len; ++i) {
        records_[symbols[i]] = RateRecord{ rates[i], resolveTimes[i], requestIds[i] };
    }
}

std::optional<RateRecord> ReferenceStore::get(const std::string& symbol) const {
    auto it = records_.find(symbol);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace sr
