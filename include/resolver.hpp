#pragma once

#include "ref_data.hpp"
#include "reference_store.hpp"

#include <cstdint>
#include <string>

namespace sr {

class Resolver {
public:
    explicit Resolver(const ReferenceStore& store) : store_(store) {}

    // Throws OracleError(UnknownSymbol) or OracleError(RefDataNotAvailable).
    ResolvedPair resolve(const std::string& symbol, std::uint64_t currentTime) const;

    // Price of base denominated in quote, scaled by 1e18 and truncated.
    ReferenceData crossRate(const std::string& baseSymbol,
                            const std::string& quoteSymbol,
                            std::uint64_t currentTime) const;

private:
    const ReferenceStore& store_;
};

} // namespace sr
