#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <string>

namespace sr {

using BigUint = boost::multiprecision::cpp_int;

// The anchor is never stored; it always resolves to one unit at the current block time.
inline const std::string kAnchorSymbol = "USD";
constexpr std::uint64_t kAnchorRate = 1'000'000'000;      // 1e9
constexpr std::uint64_t kCrossRateScale = 1'000'000'000'000'000'000ULL; // 1e18

struct RateRecord {
    std::uint64_t rate = 0;
    std::uint64_t resolveTime = 0; // 0 = never resolved
    std::uint64_t requestId = 0;

    bool operator==(const RateRecord& other) const {
        return rate == other.rate && resolveTime == other.resolveTime &&
               requestId == other.requestId;
    }
    bool operator!=(const RateRecord& other) const { return !(*this == other); }
};

struct ResolvedPair {
    std::uint64_t rate = 0;
    std::uint64_t lastUpdate = 0;
};

struct ReferenceData {
    BigUint rate;
    BigUint lastUpdatedBase;
    BigUint lastUpdatedQuote;
};

} // namespace sr
