#include "modelmig/core/types.h"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

namespace modelmig {
namespace core {

namespace {

const std::regex kUUIDPattern(
    "^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$");
const std::regex kUserPattern("^[a-zA-Z0-9](?:[a-zA-Z0-9.+-]*[a-zA-Z0-9])?$");
const std::regex kMachinePattern("^(?:0|[1-9][0-9]*)(?:/[a-z]+/(?:0|[1-9][0-9]*))*$");
const std::regex kUnitPattern(
    "^[a-z][a-z0-9]*(?:-[a-z0-9]*[a-z][a-z0-9]*)*/(?:0|[1-9][0-9]*)$");

} // namespace

Timestamp SystemClock::now() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::shared_ptr<Clock> SystemClock::Instance() {
    static std::shared_ptr<Clock> instance = std::make_shared<SystemClock>();
    return instance;
}

const char* tag_kind_prefix(Tag::Kind kind) {
    switch (kind) {
        case Tag::Kind::USER: return "user";
        case Tag::Kind::MACHINE: return "machine";
        case Tag::Kind::UNIT: return "unit";
        case Tag::Kind::CONTROLLER: return "controller";
        case Tag::Kind::MODEL: return "model";
        case Tag::Kind::NONE: break;
    }
    return "";
}

bool is_valid_uuid(const std::string& text) {
    return std::regex_match(text, kUUIDPattern);
}

bool is_valid_user_name(const std::string& name) {
    return std::regex_match(name, kUserPattern);
}

bool is_valid_machine_id(const std::string& id) {
    return std::regex_match(id, kMachinePattern);
}

bool is_valid_unit_name(const std::string& name) {
    return std::regex_match(name, kUnitPattern);
}

bool Tag::is_valid() const {
    switch (kind_) {
        case Kind::USER: return is_valid_user_name(id_);
        case Kind::MACHINE: return is_valid_machine_id(id_);
        case Kind::UNIT: return is_valid_unit_name(id_);
        case Kind::CONTROLLER:
        case Kind::MODEL: return is_valid_uuid(id_);
        case Kind::NONE: break;
    }
    return false;
}

std::string Tag::to_string() const {
    if (kind_ == Kind::NONE) {
        return "";
    }
    std::string body = id_;
    if (kind_ == Kind::MACHINE || kind_ == Kind::UNIT) {
        std::replace(body.begin(), body.end(), '/', '-');
    }
    return std::string(tag_kind_prefix(kind_)) + "-" + body;
}

Result<Tag> Tag::parse(const std::string& text) {
    auto dash = text.find('-');
    if (dash == std::string::npos || dash + 1 >= text.size()) {
        return NotValidError("\"" + text + "\" is not a valid tag");
    }
    std::string prefix = text.substr(0, dash);
    std::string body = text.substr(dash + 1);

    Kind kind = Kind::NONE;
    for (Kind candidate : {Kind::USER, Kind::MACHINE, Kind::UNIT, Kind::CONTROLLER, Kind::MODEL}) {
        if (prefix == tag_kind_prefix(candidate)) {
            kind = candidate;
            break;
        }
    }
    if (kind == Kind::NONE) {
        return NotValidError("\"" + text + "\" is not a valid tag");
    }

    if (kind == Kind::MACHINE) {
        std::replace(body.begin(), body.end(), '-', '/');
    } else if (kind == Kind::UNIT) {
        auto last = body.rfind('-');
        if (last != std::string::npos) {
            body[last] = '/';
        }
    }

    Tag tag(kind, body);
    if (!tag.is_valid()) {
        return NotValidError("\"" + text + "\" is not a valid " + prefix + " tag");
    }
    return tag;
}

std::string new_uuid() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << "-"
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-"
        << std::setw(4) << (hi & 0xFFFF) << "-"
        << std::setw(4) << (lo >> 48) << "-"
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

} // namespace core
} // namespace modelmig
