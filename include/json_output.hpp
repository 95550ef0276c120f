#pragma once

#include "ref_data.hpp"
#include "reference_store.hpp"

#include <string>

namespace sr {

std::string jsonEscape(const std::string& value);

// {"ETH":{"rate":"1","resolve_time":"2","request_id":"3"},...}
std::string refsToJson(const ReferenceStore::RecordMap& refs);

// Integers are rendered as decimal strings; they may exceed 64 bits.
std::string referenceDataToJson(const ReferenceData& data);

} // namespace sr
