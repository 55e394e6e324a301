#include "ErrorCodes.h"

namespace CodeDrop {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::WeakCode: return "WeakCode";
        case ErrorCode::IntegrityError: return "IntegrityError";
        case ErrorCode::CryptoFailure: return "CryptoFailure";
        case ErrorCode::ProbeTimeout: return "ProbeTimeout";
        case ErrorCode::BackendUnavailable: return "BackendUnavailable";
        case ErrorCode::SendFailure: return "SendFailure";
        case ErrorCode::ReceiveFailure: return "ReceiveFailure";
        case ErrorCode::AttemptTimeout: return "AttemptTimeout";
        case ErrorCode::AllTransportsExhausted: return "AllTransportsExhausted";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::TransferInProgress: return "TransferInProgress";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::InvalidPackage: return "InvalidPackage";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::InternalError: return "InternalError";
    }
    return "Unknown";
}

bool isFatal(ErrorCode code) {
    switch (code) {
        case ErrorCode::ProbeTimeout:
        case ErrorCode::BackendUnavailable:
        case ErrorCode::SendFailure:
        case ErrorCode::ReceiveFailure:
        case ErrorCode::AttemptTimeout:
            return false;
        default:
            return code != ErrorCode::None;
    }
}

} // namespace CodeDrop
