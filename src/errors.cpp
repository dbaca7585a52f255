#include "errors.hpp"

namespace macfence {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidMacFormat: return "InvalidMacFormat";
        case ErrorCode::InvalidName: return "InvalidName";
        case ErrorCode::DuplicateMac: return "DuplicateMac";
        case ErrorCode::DuplicateName: return "DuplicateName";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::PersistFailed: return "PersistError";
        case ErrorCode::MalformedDocument: return "MalformedDocument";
        default: return "Unknown";
    }
}

} // namespace macfence
