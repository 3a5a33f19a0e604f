#include "nodus/core/errors.hpp"

namespace nodus::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::InvalidIdentifier: return "InvalidIdentifier";
            case StatusCode::DuplicateFramework: return "DuplicateFramework";
            case StatusCode::UnknownKind: return "UnknownKind";
            case StatusCode::UnsupportedIndirection: return "UnsupportedIndirection";
            case StatusCode::NotImplemented: return "NotImplemented";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Identity: return "Identity";
            case StatusDomain::Store: return "Store";
            case StatusDomain::Net: return "Net";
            case StatusDomain::Router: return "Router";
            case StatusDomain::Worker: return "Worker";
            case StatusDomain::Framework: return "Framework";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace nodus::core
