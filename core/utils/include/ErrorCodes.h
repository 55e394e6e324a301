#pragma once

#include <string>

namespace CodeDrop {

/**
 * @brief Error taxonomy shared by every orchestration component
 *
 * Fatal codes end a session immediately; per-backend codes are absorbed by
 * the TransportManager and only escalate as AllTransportsExhausted.
 */
enum class ErrorCode : int {
    None = 0,

    // Security (100-199)
    WeakCode = 100,
    IntegrityError = 101,
    CryptoFailure = 102,

    // Network / transport (200-299)
    ProbeTimeout = 200,
    BackendUnavailable = 201,
    SendFailure = 202,
    ReceiveFailure = 203,
    AttemptTimeout = 204,
    AllTransportsExhausted = 205,

    // Session (300-399)
    Cancelled = 300,
    TransferInProgress = 301,
    InvalidState = 302,
    InvalidPackage = 303,

    // General (900-999)
    InvalidArgument = 900,
    InvalidConfig = 901,
    IoError = 902,
    InternalError = 999
};

const char* errorCodeName(ErrorCode code);

/**
 * @brief True for codes that end a session without further attempts.
 */
bool isFatal(ErrorCode code);

} // namespace CodeDrop
