#include "config.hpp"
#include "json_output.hpp"
#include "oracle_contract.hpp"
#include "oracle_error.hpp"
#include "state_storage.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sr;

namespace {

void printUsage() {
    std::cerr << "Usage:\n"
              << "  stdref init\n"
              << "  stdref relay <symbols> <rates> <resolve_times> <request_ids>   (comma-separated)\n"
              << "  stdref refs\n"
              << "  stdref query <base> <quote> [block_time_ns]\n";
    std::cerr << "Environment: SR_STATE_PATH (default " << kDefaultStatePath
              << "), SR_AUTHORIZED_RELAYERS, SR_SENDER.\n";
}

std::uint64_t parseU64(const std::string& text, const std::string& field) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        })) {
        throw std::invalid_argument(field + " must be an unsigned integer: \"" + text + "\"");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(field + " does not fit in 64 bits: \"" + text + "\"");
    }
}

std::vector<std::uint64_t> parseU64List(const std::string& text, const std::string& field) {
    std::vector<std::uint64_t> out;
    for (const auto& item : splitList(text)) {
        out.push_back(parseU64(item, field));
    }
    return out;
}

std::uint64_t wallClockNanos() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

int run(const std::vector<std::string>& args) {
    const std::string& command = args[0];
    OracleConfig cfg = loadConfigFromEnv();
    OracleContract contract(std::make_shared<FileStateStorage>(cfg.statePath), cfg);

    ExecutionContext ctx;
    ctx.sender = cfg.sender;
    ctx.blockTimeNanos = wallClockNanos();

    if (command == "init" && args.size() == 1) {
        contract.instantiate(ctx);
        std::cout << "Initialized empty reference store at " << cfg.statePath << "\n";
        return 0;
    }

    if (command == "relay" && args.size() == 5) {
        RelayBatch batch;
        batch.symbols = splitSymbols(args[1]);
        batch.rates = parseU64List(args[2], "rate");
        batch.resolveTimes = parseU64List(args[3], "resolve_time");
        batch.requestIds = parseU64List(args[4], "request_id");
        contract.relay(ctx, batch);
        std::cout << "Relayed " << batch.symbols.size() << " reference record(s)\n";
        return 0;
    }

    if (command == "refs" && args.size() == 1) {
        std::cout << refsToJson(contract.getRefs());
        return 0;
    }

    if (command == "query" && (args.size() == 3 || args.size() == 4)) {
        if (args.size() == 4) {
            ctx.blockTimeNanos = parseU64(args[3], "block_time_ns");
        }
        std::cout << referenceDataToJson(contract.getReferenceData(ctx, args[1], args[2]));
        return 0;
    }

    printUsage();
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        return run(args);
    } catch (const OracleError& ex) {
        std::cerr << "error: " << toString(ex.code()) << ": " << ex.what() << "\n";
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << "\n";
    }
    return 1;
}
