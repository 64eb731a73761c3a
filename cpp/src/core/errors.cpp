#include "termoracle/core/errors.hpp"

namespace termoracle::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::Conflict: return "Conflict";
        case StatusCode::Busy: return "Busy";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Network: return "Network";
        case StatusCode::Closed: return "Closed";
        case StatusCode::Timeout: return "Timeout";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::Unavailable: return "Unavailable";
        case StatusCode::Cancelled: return "Cancelled";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Hash: return "Hash";
        case StatusDomain::Schema: return "Schema";
        case StatusDomain::Registry: return "Registry";
        case StatusDomain::Trace: return "Trace";
        case StatusDomain::Session: return "Session";
        case StatusDomain::Net: return "Net";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace termoracle::core
