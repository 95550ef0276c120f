#pragma once

#include "ref_data.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sr {

class ReferenceStore {
public:
    using RecordMap = std::map<std::string, RateRecord>;

    ReferenceStore() = default;
    explicit ReferenceStore(RecordMap records) : records_(std::move(records)) {}

    // Index i across the four sequences describes one update. Lengths are checked
    // before anything is written; on duplicates the later index wins.
    void applyBatch(const std::vector<std::string>& symbols,
                    const std::vector<std::uint64_t>& rates,
                    const std::vector<std::uint64_t>& resolveTimes,
                    const std::vector<std::uint64_t>& requestIds);

    std::optional<RateRecord> get(const std::string& symbol) const;

    const RecordMap& snapshot() const { return records_; }
    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    RecordMap records_;
};

} // namespace sr
