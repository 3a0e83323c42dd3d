#pragma once

#include <string>
#include <utility>

namespace canvascore {

enum class IoErrorCode {
    None,
    OpenFailed,         ///< Database could not be opened or its schema created
    QueryFailed,        ///< Statement preparation or execution failed
    TransactionFailed,  ///< Batch rolled back
    Closed              ///< Store or writer no longer accepts work
};

const char* ioErrorCodeToString(IoErrorCode code);

/// Outcome of a storage operation. Never thrown across the interaction boundary.
struct IoResult {
    bool ok = true;
    IoErrorCode code = IoErrorCode::None;
    std::string message;

    static IoResult success() { return {}; }
    static IoResult fail(IoErrorCode code, std::string message) {
        return {false, code, std::move(message)};
    }

    explicit operator bool() const { return ok; }

    std::string toString() const;
};

}  // namespace canvascore
