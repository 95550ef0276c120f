#include "state_audit.hpp"

#include "state_codec.hpp"

#include <iomanip>
#include <sstream>

namespace sr {

StateAudit auditState(const std::string& blob) {
    StateAudit audit;
    audit.store = decodeState(blob);
    audit.digestHex = stateDigestHex(blob);
    audit.blobSize = blob.size();
    for (const auto& entry : audit.store.snapshot()) {
        if (entry.second.resolveTime == 0) {
            audit.unresolvedSymbols.push_back(entry.first);
        }
    }
    return audit;
}

std::string formatAuditReport(const std::string& path, const StateAudit& audit) {
    std::ostringstream oss;
    oss << "State file: " << path << " (" << audit.blobSize << " bytes)\n";
    oss << "SHA-256: " << audit.digestHex << "\n";
    oss << "Records: " << audit.store.size() << "\n";
    for (const auto& entry : audit.store.snapshot()) {
        oss << "  " << std::setw(10) << std::left << entry.first
            << " rate=" << entry.second.rate
            << " resolve_time=" << entry.second.resolveTime
            << " request_id=" << entry.second.requestId;
        if (entry.second.resolveTime == 0) {
            oss << "  [unresolved]";
        }
        oss << "\n";
    }
    if (!audit.unresolvedSymbols.empty()) {
        oss << audit.unresolvedSymbols.size() << " record(s) have never been resolved\n";
    }
    return oss.str();
}

} // namespace sr
