#include "modelmig/core/migration_spec.h"
#include <cctype>

namespace modelmig {
namespace core {

bool is_valid_host_port(const std::string& addr) {
    std::string host;
    std::string port;
    if (!addr.empty() && addr[0] == '[') {
        auto close = addr.find("]:");
        if (close == std::string::npos) {
            return false;
        }
        host = addr.substr(1, close - 1);
        port = addr.substr(close + 2);
    } else {
        auto colon = addr.rfind(':');
        if (colon == std::string::npos) {
            return false;
        }
        host = addr.substr(0, colon);
        port = addr.substr(colon + 1);
        if (host.find(':') != std::string::npos) {
            // Bare IPv6 without brackets is ambiguous
            return false;
        }
    }
    if (host.empty() || port.empty() || port.size() > 5) {
        return false;
    }
    for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    int value = std::stoi(port);
    return value > 0 && value <= 65535;
}

Result<void> TargetInfo::validate() const {
    Tag::Kind kind = controller_tag.kind();
    if (kind != Tag::Kind::CONTROLLER && kind != Tag::Kind::MODEL) {
        return NotValidError("ControllerTag not valid");
    }
    if (!is_valid_uuid(controller_tag.id())) {
        return NotValidError("ControllerTag not valid");
    }
    if (addrs.empty()) {
        return NotValidError("empty Addrs not valid");
    }
    for (const auto& addr : addrs) {
        if (!is_valid_host_port(addr)) {
            return NotValidError("\"" + addr + "\" in Addrs not valid");
        }
    }
    if (ca_cert.empty()) {
        return NotValidError("empty CACert not valid");
    }
    if (auth_tag.id().empty()) {
        return NotValidError("empty AuthTag not valid");
    }
    if (password.empty()) {
        return NotValidError("empty Password not valid");
    }
    return Result<void>();
}

bool TargetInfo::operator==(const TargetInfo& other) const {
    return controller_tag == other.controller_tag &&
           addrs == other.addrs &&
           ca_cert == other.ca_cert &&
           auth_tag == other.auth_tag &&
           password == other.password;
}

Result<void> MigrationSpec::validate() const {
    if (initiated_by.kind() != Tag::Kind::USER || !initiated_by.is_valid()) {
        return NotValidError("InitiatedBy not valid");
    }
    return target_info.validate();
}

} // namespace core
} // namespace modelmig
