#include "resolver.hpp"

#include "oracle_error.hpp"

namespace sr {

ResolvedPair Resolver::resolve(const std::string& symbol, std::uint64_t currentTime) const {
    if (symbol == kAnchorSymbol) {
        return ResolvedPair{ kAnchorRate, currentTime };
    }

    auto record = store_.get(symbol);
    if (!record) {
        throw OracleError(OracleErrc::UnknownSymbol, "no reference data for symbol " + symbol);
    }
    if (record->resolveTime == 0) {
        throw OracleError(OracleErrc::RefDataNotAvailable,
                          "reference data for " + symbol + " has never been resolved");
    }
    return ResolvedPair{ record->rate, record->resolveTime };
}

ReferenceData Resolver::crossRate(const std::string& baseSymbol,
                                  const std::string& quoteSymbol,
                                  std::uint64_t currentTime) const {
    ResolvedPair base = resolve(baseSymbol, currentTime);
    ResolvedPair quote = resolve(quoteSymbol, currentTime);

    if (quote.rate == 0) {
        throw OracleError(OracleErrc::DivisionByZero,
                          "quote symbol " + quoteSymbol + " resolved to a zero rate");
    }

    ReferenceData out;
    out.rate = (BigUint(base.rate) * BigUint(kCrossRateScale)) / BigUint(quote.rate);
    out.lastUpdatedBase = BigUint(base.lastUpdate);
    out.lastUpdatedQuote = BigUint(quote.lastUpdate);
    return out;
}

} // namespace sr
