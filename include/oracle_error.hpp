#pragma once

#include <stdexcept>
#include <string>

namespace sr {

enum class OracleErrc {
    MismatchedBatchLength,
    UnknownSymbol,
    RefDataNotAvailable,
    DivisionByZero,
    StateNotInitialized,
    StateCorrupted,
    Unauthorized
};

const char* toString(OracleErrc code);

// Every failure of the oracle core is reported through this type; none are fatal.
class OracleError : public std::runtime_error {
public:
    OracleError(OracleErrc code, const std::string& message);

    OracleErrc code() const { return code_; }

private:
    OracleErrc code_;
};

} // namespace sr
