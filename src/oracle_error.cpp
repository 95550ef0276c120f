#include "oracle_error.hpp"

namespace sr {

const char* toString(OracleErrc code) {
    switch (code) {
    case OracleErrc::MismatchedBatchLength:
        return "MismatchedBatchLength";
    case OracleErrc::UnknownSymbol:
        return "UnknownSymbol";
    case OracleErrc::RefDataNotAvailable:
        return "RefDataNotAvailable";
    case OracleErrc::DivisionByZero:
        return "DivisionByZero";
    case OracleErrc::StateNotInitialized:
        return "StateNotInitialized";
    case OracleErrc::StateCorrupted:
        return "StateCorrupted";
    case OracleErrc::Unauthorized:
        return "Unauthorized";
    }
    return "Unknown";
}

OracleError::OracleError(OracleErrc code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

} // namespace sr
