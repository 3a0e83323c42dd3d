#include "canvascore/persistence/IoResult.h"

namespace canvascore {

const char* ioErrorCodeToString(IoErrorCode code) {
    switch (code) {
        case IoErrorCode::None: return "None";
        case IoErrorCode::OpenFailed: return "OpenFailed";
        case IoErrorCode::QueryFailed: return "QueryFailed";
        case IoErrorCode::TransactionFailed: return "TransactionFailed";
        case IoErrorCode::Closed: return "Closed";
    }
    return "Unknown";
}

std::string IoResult::toString() const {
    if (ok) {
        return "ok";
    }
    return std::string(ioErrorCodeToString(code)) + ": " + message;
}

}  // namespace canvascore
