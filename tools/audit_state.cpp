#include "oracle_error.hpp"
#include "state_audit.hpp"
#include "state_storage.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: stdref_audit_state <state_path>\n";
        return 1;
    }

    try {
        sr::FileStateStorage storage(argv[1]);
        auto blob = storage.load();
        if (!blob) {
            std::cerr << "No state file at " << storage.path() << "\n";
            return 1;
        }
        std::cout << sr::formatAuditReport(storage.path(), sr::auditState(*blob));
    } catch (const sr::OracleError& ex) {
        std::cerr << "error: " << sr::toString(ex.code()) << ": " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
