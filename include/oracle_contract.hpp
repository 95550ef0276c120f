#pragma once

#include "config.hpp"
#include "ref_data.hpp"
#include "reference_store.hpp"
#include "state_storage.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sr {

// Supplied by the host on every invocation.
struct ExecutionContext {
    std::string sender;
    std::uint64_t blockTimeNanos = 0;
};

struct RelayBatch {
    std::vector<std::string> symbols;
    std::vector<std::uint64_t> rates;
    std::vector<std::uint64_t> resolveTimes;
    std::vector<std::uint64_t> requestIds;
};

// Entry operations of the oracle. Each call loads the store from the injected
// storage, runs to completion, and writes back only on a successful relay.
class OracleContract {
public:
    explicit OracleContract(StateStoragePtr storage, OracleConfig config = {});

    void instantiate(const ExecutionContext& ctx);
    void relay(const ExecutionContext& ctx, const RelayBatch& batch);

    ReferenceStore::RecordMap getRefs() const;
    ReferenceData getReferenceData(const ExecutionContext& ctx,
                                   const std::string& base,
                                   const std::string& quote) const;

    bool isAuthorizedRelayer(const std::string& sender) const;

private:
    ReferenceStore loadStore() const;
    void saveStore(const ReferenceStore& store);

    StateStoragePtr storage_;
    OracleConfig config_;
};

} // namespace sr
