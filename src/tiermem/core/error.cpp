#include "tiermem/core/error.h"

namespace tiermem {
namespace core {

const char* error_code_name(Error::Code code) {
    switch (code) {
        case Error::Code::INVALID_ARGUMENT: return "invalid_argument";
        case Error::Code::NOT_FOUND: return "not_found";
        case Error::Code::CHAIN_INTEGRITY: return "chain_integrity";
        case Error::Code::OWNER_BUSY: return "owner_busy";
        case Error::Code::STORAGE_FAILURE: return "storage_failure";
        case Error::Code::INTERNAL: return "internal";
        case Error::Code::UNKNOWN: break;
    }
    return "unknown";
}

} // namespace core
} // namespace tiermem
