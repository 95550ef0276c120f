#pragma once

#include "reference_store.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sr {

struct StateAudit {
    std::string digestHex;
    std::size_t blobSize = 0;
    ReferenceStore store;
    std::vector<std::string> unresolvedSymbols; // resolveTime == 0, in symbol order
};

// Throws OracleError(StateCorrupted) when the blob does not verify.
StateAudit auditState(const std::string& blob);

std::string formatAuditReport(const std::string& path, const StateAudit& audit);

} // namespace sr
