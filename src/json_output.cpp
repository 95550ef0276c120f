#include "json_output.hpp"

#include <iomanip>
#include <sstream>

namespace sr {

std::string jsonEscape(const std::string& value) {
    std::ostringstream oss;
    for (unsigned char c : value) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (c < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                    << std::dec;
            } else {
                oss << static_cast<char>(c);
            }
        }
    }
    return oss.str();
}

std::string refsToJson(const ReferenceStore::RecordMap& refs) {
    std::ostringstream json;
    json << "{";
    bool first = true;
    for (const auto& entry : refs) {
        if (!first) {
            json << ",";
        }
        first = false;
        json << "\n  \"" << jsonEscape(entry.first) << "\": {"
             << "\"rate\": \"" << entry.second.rate << "\", "
             << "\"resolve_time\": \"" << entry.second.resolveTime << "\", "
             << "\"request_id\": \"" << entry.second.requestId << "\"}";
    }
    if (!refs.empty()) {
        json << "\n";
    }
    json << "}\n";
    return json.str();
}

std::string referenceDataToJson(const ReferenceData& data) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"rate\": \"" << data.rate.str() << "\",\n";
    json << "  \"last_updated_base\": \"" << data.lastUpdatedBase.str() << "\",\n";
    json << "  \"last_updated_quote\": \"" << data.lastUpdatedQuote.str() << "\"\n";
    json << "}\n";
    return json.str();
}

} // namespace sr
