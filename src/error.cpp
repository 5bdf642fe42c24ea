#include "uuidkey/error.hpp"

namespace uuidkey {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidKeyFormat:
            return "InvalidKeyFormat";
        case ErrorCode::InvalidUuidLength:
            return "InvalidUuidLength";
        case ErrorCode::InvalidUuidFormat:
            return "InvalidUuidFormat";
        case ErrorCode::InvalidUuidByteLength:
            return "InvalidUuidByteLength";
        case ErrorCode::EmptyPrefix:
            return "EmptyPrefix";
        case ErrorCode::InvalidPrefix:
            return "InvalidPrefix";
        case ErrorCode::EmptyInput:
            return "EmptyInput";
        case ErrorCode::WrongPartCount:
            return "WrongPartCount";
        case ErrorCode::InsufficientLength:
            return "InsufficientLength";
        case ErrorCode::InvalidChecksumFormat:
            return "InvalidChecksumFormat";
        case ErrorCode::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorCode::EntropyUnavailable:
            return "EntropyUnavailable";
    }
    return "Unknown";
}

std::string Error::Format() const {
    std::string out = "error[";
    out += ErrorCodeName(code);
    out += "]: ";
    out += message;
    return out;
}

}  // namespace uuidkey
