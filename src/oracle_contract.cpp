#include "oracle_contract.hpp"

#include "oracle_error.hpp"
#include "resolver.hpp"
#include "state_codec.hpp"

#include <algorithm>
#include <stdexcept>

namespace sr {

OracleContract::OracleContract(StateStoragePtr storage, OracleConfig config)
    : storage_(std::move(storage)), config_(std::move(config)) {
    if (!storage_) {
        throw std::invalid_argument("OracleContract requires a state storage handle");
    }
}

void OracleContract::instantiate(const ExecutionContext& /*ctx*/) {
    saveStore(ReferenceStore{});
}

void OracleContract::relay(const ExecutionContext& ctx, const RelayBatch& batch) {
    if (!isAuthorizedRelayer(ctx.sender)) {
        throw OracleError(OracleErrc::Unauthorized, "sender " + ctx.sender + " may not relay");
    }
    ReferenceStore store = loadStore();
    store.applyBatch(batch.symbols, batch.rates, batch.resolveTimes, batch.requestIds);
    saveStore(store);
}

ReferenceStore::RecordMap OracleContract::getRefs() const {
    return loadStore().snapshot();
}

ReferenceData OracleContract::getReferenceData(const ExecutionContext& ctx,
                                               const std::string& base,
                                               const std::string& quote) const {
    ReferenceStore store = loadStore();
    Resolver resolver(store);
    return resolver.crossRate(base, quote, ctx.blockTimeNanos);
}

bool OracleContract::isAuthorizedRelayer(const std::string& sender) const {
    if (config_.authorizedRelayers.empty()) {
        return true;
    }
    return std::find(config_.authorizedRelayers.begin(), config_.authorizedRelayers.end(), sender) !=
           config_.authorizedRelayers.end();
}

ReferenceStore OracleContract::loadStore() const {
    auto blob = storage_->load();
    if (!blob) {
        throw OracleError(OracleErrc::StateNotInitialized, "oracle state has not been instantiated");
    }
    return decodeState(*blob);
}

void OracleContract::saveStore(const ReferenceStore& store) {
    storage_->save(encodeState(store));
}

} // namespace sr
