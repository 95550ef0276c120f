#pragma once

#include <string>
#include <vector>

namespace sr {

constexpr char kDefaultStatePath[] = "stdref_state.bin";
constexpr char kDefaultSender[] = "cli";

struct OracleConfig {
    // Empty: any sender may relay.
    std::vector<std::string> authorizedRelayers;
    std::string statePath = kDefaultStatePath;
    std::string sender = kDefaultSender;
};

// Reads SR_STATE_PATH, SR_AUTHORIZED_RELAYERS and SR_SENDER.
OracleConfig loadConfigFromEnv();

// Comma-separated, each item trimmed. Blank input yields no items.
std::vector<std::string> splitList(const std::string& value);
// Comma-separated with items kept byte-for-byte; symbols are never normalized.
std::vector<std::string> splitSymbols(const std::string& value);
std::string trim(const std::string& value);

} // namespace sr
