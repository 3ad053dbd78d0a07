#pragma once

#include <string>
#include <stdexcept>
#include <utility>

enum class ErrorCode {
    // RPC / endpoint selection
    EndpointUnreachable = 1001,
    WrongChain = 1002,
    AllEndpointsFailed = 1003,
    RpcFailed = 1004,
    RegistryUnavailable = 1005,
    NoReliableEndpoints = 1006,

    // Configuration
    InvalidInput = 2001,
    NoConfiguration = 2002,
    NotConfigured = 2003,
    NoBackupAvailable = 2004,
    DuplicateEndpoint = 2005,

    // Contract reads
    ContractCallFailed = 3001,
    SourceNotFound = 3002,

    // Key storage
    EncryptionFailed = 5001
};

const char* error_code_name(ErrorCode code);

class RailError : public std::runtime_error {
public:
    RailError(ErrorCode code, const std::string& message, std::string hint = "")
        : std::runtime_error(message)
        , code_(code)
        , hint_(std::move(hint))
    {}

    ErrorCode code() const { return code_; }
    const std::string& hint() const { return hint_; }

private:
    ErrorCode code_;
    std::string hint_;
};
