#include "modelmig/core/error.h"
#include "modelmig/core/result.h"

namespace modelmig {
namespace core {

const char* error_code_name(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "unknown";
        case Error::Code::NOT_VALID: return "not valid";
        case Error::Code::NOT_FOUND: return "not found";
        case Error::Code::ALREADY_EXISTS: return "already exists";
        case Error::Code::CONFLICT: return "conflict";
        case Error::Code::RACE: return "race";
        case Error::Code::ILLEGAL_TRANSITION: return "illegal transition";
        case Error::Code::REPORT_CONFLICT: return "report conflict";
        case Error::Code::TXN_ABORTED: return "transaction aborted";
        case Error::Code::EXCESSIVE_CONTENTION: return "excessive contention";
        case Error::Code::INTERNAL: return "internal";
    }
    return "unknown";
}

// Explicit template instantiations
template class Result<std::string>;
template class Result<std::vector<std::string>>;

}  // namespace core
}  // namespace modelmig
