#include "config.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace sr {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> parts;
    if (trim(value).empty()) {
        return parts;
    }
    std::stringstream ss(value);
    std::string segment;
    while (std::getline(ss, segment, ',')) {
        parts.push_back(trim(segment));
    }
    if (!value.empty() && value.back() == ',') {
        parts.emplace_back();
    }
    return parts;
}

std::vector<std::string> splitSymbols(const std::string& value) {
    std::vector<std::string> parts;
    if (value.empty()) {
        return parts;
    }
    std::string::size_type start = 0;
    while (true) {
        auto comma = value.find(',', start);
        if (comma == std::string::npos) {
            parts.push_back(value.substr(start));
            break;
        }
        parts.push_back(value.substr(start, comma - start));
        start = comma + 1;
    }
    return parts;
}

OracleConfig loadConfigFromEnv() {
    OracleConfig cfg;

    const char* pathEnv = std::getenv("SR_STATE_PATH");
    if (pathEnv != nullptr) {
        cfg.statePath = trim(pathEnv);
        if (cfg.statePath.empty()) {
            throw std::runtime_error("SR_STATE_PATH is set but empty; unset it or point it at a state file");
        }
    }

    const char* relayersEnv = std::getenv("SR_AUTHORIZED_RELAYERS");
    if (relayersEnv != nullptr) {
        for (const auto& relayer : splitList(relayersEnv)) {
            if (relayer.empty()) {
                throw std::runtime_error("SR_AUTHORIZED_RELAYERS contains an empty entry");
            }
            cfg.authorizedRelayers.push_back(relayer);
        }
    }

    const char* senderEnv = std::getenv("SR_SENDER");
    if (senderEnv != nullptr) {
        std::string sender = trim(senderEnv);
        if (!sender.empty()) {
            cfg.sender = sender;
        }
    }
    return cfg;
}

} // namespace sr
