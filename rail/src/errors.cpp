#include "errors.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::EndpointUnreachable: return "EndpointUnreachable";
        case ErrorCode::WrongChain: return "WrongChain";
        case ErrorCode::AllEndpointsFailed: return "AllEndpointsFailed";
        case ErrorCode::RpcFailed: return "RpcFailed";
        case ErrorCode::RegistryUnavailable: return "RegistryUnavailable";
        case ErrorCode::NoReliableEndpoints: return "NoReliableEndpoints";
        case ErrorCode::InvalidInput: return "InvalidInput";
        case ErrorCode::NoConfiguration: return "NoConfiguration";
        case ErrorCode::NotConfigured: return "NotConfigured";
        case ErrorCode::NoBackupAvailable: return "NoBackupAvailable";
        case ErrorCode::DuplicateEndpoint: return "DuplicateEndpoint";
        case ErrorCode::ContractCallFailed: return "ContractCallFailed";
        case ErrorCode::SourceNotFound: return "SourceNotFound";
        case ErrorCode::EncryptionFailed: return "EncryptionFailed";
    }
    return "Unknown";
}
