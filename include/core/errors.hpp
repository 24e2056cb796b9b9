#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace rolldesk {

/**
 * Error taxonomy shared by every component.
 *
 * Market-data reads that time out return partial data instead of throwing
 * RequestTimeout. Account requests throw it only when nothing arrived at all.
 */
enum class ErrorCode : uint8_t {
    NotConnected = 0,
    RequestTimeout,
    ContractNotFound,
    ResolutionTimeout,
    LegResolutionFailed,
    InvalidRequest,
    ConfigError,
    GatewayRejected
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotConnected:
        return "NotConnected";
    case ErrorCode::RequestTimeout:
        return "RequestTimeout";
    case ErrorCode::ContractNotFound:
        return "ContractNotFound";
    case ErrorCode::ResolutionTimeout:
        return "ResolutionTimeout";
    case ErrorCode::LegResolutionFailed:
        return "LegResolutionFailed";
    case ErrorCode::InvalidRequest:
        return "InvalidRequest";
    case ErrorCode::ConfigError:
        return "ConfigError";
    case ErrorCode::GatewayRejected:
        return "GatewayRejected";
    default:
        return "Unknown";
    }
}

class DeskError : public std::runtime_error {
public:
    DeskError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(error_code_to_string(code)) + ": " + message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class NotConnectedError : public DeskError {
public:
    explicit NotConnectedError(const std::string& what_for)
        : DeskError(ErrorCode::NotConnected, "no active gateway session (" + what_for + ")") {}
};

class RequestTimeoutError : public DeskError {
public:
    explicit RequestTimeoutError(const std::string& what_for) : DeskError(ErrorCode::RequestTimeout, what_for) {}
};

/// A non-informational gateway error ended the request
class GatewayRejectedError : public DeskError {
public:
    GatewayRejectedError(const std::string& what_for, int gateway_code, const std::string& message)
        : DeskError(ErrorCode::GatewayRejected,
                    what_for + ": " + message + " (code " + std::to_string(gateway_code) + ")"),
          gateway_code_(gateway_code) {}

    int gateway_code() const { return gateway_code_; }

private:
    int gateway_code_;
};

class ContractNotFoundError : public DeskError {
public:
    explicit ContractNotFoundError(const std::string& contract)
        : DeskError(ErrorCode::ContractNotFound, contract) {}
};

class ResolutionTimeoutError : public DeskError {
public:
    explicit ResolutionTimeoutError(const std::string& contract)
        : DeskError(ErrorCode::ResolutionTimeout, contract) {}
};

class LegResolutionFailedError : public DeskError {
public:
    explicit LegResolutionFailedError(const std::string& detail)
        : DeskError(ErrorCode::LegResolutionFailed, detail) {}
};

class ConfigError : public DeskError {
public:
    explicit ConfigError(const std::string& detail) : DeskError(ErrorCode::ConfigError, detail) {}
};

}  // namespace rolldesk
