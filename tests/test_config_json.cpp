#include "config.hpp"
#include "json_output.hpp"
#include "oracle_error.hpp"
#include "reference_store.hpp"
#include "resolver.hpp"
#include "state_audit.hpp"
#include "state_codec.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "config_json_test failure: " << msg << std::endl;
    std::exit(1);
}

void clearEnv() {
    unsetenv("SR_STATE_PATH");
    unsetenv("SR_AUTHORIZED_RELAYERS");
    unsetenv("SR_SENDER");
}

bool configRejected() {
    try {
        sr::loadConfigFromEnv();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

void testConfigFromEnv() {
    using namespace sr;

    clearEnv();
    OracleConfig defaults = loadConfigFromEnv();
    if (defaults.statePath != kDefaultStatePath || defaults.sender != kDefaultSender ||
        !defaults.authorizedRelayers.empty()) {
        fail("unset environment did not produce defaults");
    }

    setenv("SR_STATE_PATH", "   ", 1);
    if (!configRejected()) {
        fail("blank SR_STATE_PATH was accepted");
    }
    setenv("SR_STATE_PATH", " /var/lib/stdref/state.bin ", 1);
    if (loadConfigFromEnv().statePath != "/var/lib/stdref/state.bin") {
        fail("SR_STATE_PATH was not trimmed");
    }
    clearEnv();

    setenv("SR_AUTHORIZED_RELAYERS", "relayer-a,,relayer-b", 1);
    if (!configRejected()) {
        fail("empty middle relayer entry was accepted");
    }
    setenv("SR_AUTHORIZED_RELAYERS", "relayer-a,", 1);
    if (!configRejected()) {
        fail("trailing empty relayer entry was accepted");
    }
    setenv("SR_AUTHORIZED_RELAYERS", "   ", 1);
    if (!loadConfigFromEnv().authorizedRelayers.empty()) {
        fail("blank SR_AUTHORIZED_RELAYERS did not leave relaying open");
    }
    setenv("SR_AUTHORIZED_RELAYERS", " relayer-a , relayer-b", 1);
    if (loadConfigFromEnv().authorizedRelayers != std::vector<std::string>{ "relayer-a", "relayer-b" }) {
        fail("relayer allow-list not parsed");
    }
    clearEnv();

    setenv("SR_SENDER", "   ", 1);
    if (loadConfigFromEnv().sender != kDefaultSender) {
        fail("blank SR_SENDER did not fall back to the default sender");
    }
    setenv("SR_SENDER", " relayer-1 ", 1);
    if (loadConfigFromEnv().sender != "relayer-1") {
        fail("SR_SENDER was not trimmed");
    }
    clearEnv();
}

void testListSplitting() {
    using namespace sr;

    if (splitList(" 1 , 2,3") != std::vector<std::string>{ "1", "2", "3" }) {
        fail("splitList did not trim items");
    }
    if (!splitList("  ").empty()) {
        fail("blank list produced items");
    }

    // Symbols go into the store verbatim.
    if (splitSymbols(" ETH , BAND") != std::vector<std::string>{ " ETH ", " BAND" }) {
        fail("splitSymbols normalized whitespace");
    }
    if (splitSymbols("eth,ETH") != std::vector<std::string>{ "eth", "ETH" }) {
        fail("splitSymbols changed case");
    }
    if (splitSymbols("MATIC,") != std::vector<std::string>{ "MATIC", "" }) {
        fail("splitSymbols dropped a trailing empty symbol");
    }
    if (!splitSymbols("").empty()) {
        fail("empty symbol list produced items");
    }
}

void testJsonOutput() {
    using namespace sr;

    if (refsToJson({}) != "{}\n") {
        fail("empty refs JSON mismatch: " + refsToJson({}));
    }

    ReferenceStore store;
    store.applyBatch({ "ETH", "BAND" }, { 1, 100 }, { 2, 200 }, { 3, 300 });
    const std::string expectedRefs =
        "{\n"
        "  \"BAND\": {\"rate\": \"100\", \"resolve_time\": \"200\", \"request_id\": \"300\"},\n"
        "  \"ETH\": {\"rate\": \"1\", \"resolve_time\": \"2\", \"request_id\": \"3\"}\n"
        "}\n";
    if (refsToJson(store.snapshot()) != expectedRefs) {
        fail("refs JSON mismatch: " + refsToJson(store.snapshot()));
    }

    ReferenceStore matic;
    matic.applyBatch({ "MATIC" }, { 112 }, { 1625108298000000000ULL }, { 124 });
    ReferenceData data = Resolver(matic).crossRate("USD", "MATIC", 1571797419879305533ULL);
    const std::string expectedData =
        "{\n"
        "  \"rate\": \"8928571428571428571428571\",\n"
        "  \"last_updated_base\": \"1571797419879305533\",\n"
        "  \"last_updated_quote\": \"1625108298000000000\"\n"
        "}\n";
    if (referenceDataToJson(data) != expectedData) {
        fail("reference data JSON mismatch: " + referenceDataToJson(data));
    }

    if (jsonEscape("a\"b\\c\nd\re\tf") != "a\\\"b\\\\c\\nd\\re\\tf") {
        fail("jsonEscape mishandled quotes, backslashes or whitespace escapes");
    }
    if (jsonEscape(std::string("x\x01y\x1f", 4)) != "x\\u0001y\\u001f") {
        fail("jsonEscape did not escape control characters: " + jsonEscape(std::string("x\x01y\x1f", 4)));
    }
}

void testStateAudit() {
    using namespace sr;

    ReferenceStore store;
    store.applyBatch({ "ETH", "NEW" }, { 1, 5 }, { 2, 0 }, { 3, 4 });
    const std::string blob = encodeState(store);

    StateAudit audit = auditState(blob);
    if (audit.unresolvedSymbols != std::vector<std::string>{ "NEW" }) {
        fail("audit did not flag exactly the unresolved record");
    }
    if (audit.digestHex != stateDigestHex(blob) || audit.blobSize != blob.size()) {
        fail("audit digest or size mismatch");
    }

    const std::string report = formatAuditReport("state.bin", audit);
    auto flag = report.find("[unresolved]");
    if (flag == std::string::npos || report.find("[unresolved]", flag + 1) != std::string::npos) {
        fail("report should flag one record:\n" + report);
    }
    auto newLine = report.rfind("NEW", flag);
    auto ethLine = report.find("ETH");
    if (newLine == std::string::npos || report.find('\n', newLine) < flag || ethLine > newLine) {
        fail("unresolved flag is not on the NEW line:\n" + report);
    }
    if (report.find("1 record(s) have never been resolved") == std::string::npos) {
        fail("report is missing the unresolved count:\n" + report);
    }

    ReferenceStore resolved;
    resolved.applyBatch({ "ETH" }, { 1 }, { 2 }, { 3 });
    if (formatAuditReport("state.bin", auditState(encodeState(resolved))).find("unresolved") !=
        std::string::npos) {
        fail("fully resolved store reported unresolved records");
    }

    bool caught = false;
    try {
        auditState(blob.substr(1));
    } catch (const OracleError& ex) {
        caught = ex.code() == OracleErrc::StateCorrupted;
    }
    if (!caught) {
        fail("audit accepted a corrupted blob");
    }
}

} // namespace

int main() {
    testConfigFromEnv();
    testListSplitting();
    testJsonOutput();
    testStateAudit();

    std::cout << "config_json_test passed" << std::endl;
    return 0;
}
