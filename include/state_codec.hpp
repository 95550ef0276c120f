#pragma once

#include "reference_store.hpp"

#include <cstddef>
#include <string>

namespace sr {

// Canonical little-endian layout of the persisted store:
// | magic "SREF" | count u64 | records... | sha256 of all preceding bytes (32 raw bytes) |
// Each record: | symbol len u64 | symbol bytes | rate u64 | resolveTime u64 | requestId u64 |
// Records are emitted in symbol order so equal stores encode to identical blobs.
constexpr char kStateMagic[] = "SREF";
constexpr std::size_t kStateMagicSize = 4;
constexpr std::size_t kStateDigestSize = 32;

std::string encodeState(const ReferenceStore& store);

// Throws OracleError(StateCorrupted) on any structural or digest mismatch.
ReferenceStore decodeState(const std::string& blob);

// Hex SHA-256 over the whole blob, for display and audit.
std::string stateDigestHex(const std::string& blob);

} // namespace sr
