#ifndef MODELMIG_CORE_TYPES_H_
#define MODELMIG_CORE_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>
#include <memory>

#include "modelmig/core/result.h"

namespace modelmig {
namespace core {

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch.
 * Zero means "not set".
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in milliseconds
 */
using Duration = int64_t;

/**
 * @brief Source of the current time, replaceable in tests
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;

    static std::shared_ptr<Clock> Instance();
};

/**
 * @brief Identity of an entity: a user, an agent or a controller
 *
 * Rendered as "<kind>-<id>" (user-admin, machine-0-lxd-1, unit-mysql-0,
 * controller-<uuid>, model-<uuid>). Machine and unit ids use '/' in id()
 * and '-' in the rendered tag.
 */
class Tag {
public:
    enum class Kind {
        NONE,
        USER,
        MACHINE,
        UNIT,
        CONTROLLER,
        MODEL
    };

    Tag() : kind_(Kind::NONE) {}
    Tag(Kind kind, std::string id) : kind_(kind), id_(std::move(id)) {}

    static Tag user(const std::string& name) { return Tag(Kind::USER, name); }
    static Tag machine(const std::string& id) { return Tag(Kind::MACHINE, id); }
    static Tag unit(const std::string& name) { return Tag(Kind::UNIT, name); }
    static Tag controller(const std::string& uuid) { return Tag(Kind::CONTROLLER, uuid); }
    static Tag model(const std::string& uuid) { return Tag(Kind::MODEL, uuid); }

    static Result<Tag> parse(const std::string& text);

    Kind kind() const { return kind_; }
    const std::string& id() const { return id_; }
    bool empty() const { return kind_ == Kind::NONE || id_.empty(); }

    // Checks the id against the syntax of its kind
    bool is_valid() const;

    std::string to_string() const;

    bool operator==(const Tag& other) const { return kind_ == other.kind_ && id_ == other.id_; }
    bool operator!=(const Tag& other) const { return !(*this == other); }
    bool operator<(const Tag& other) const { return to_string() < other.to_string(); }

private:
    Kind kind_;
    std::string id_;
};

const char* tag_kind_prefix(Tag::Kind kind);

bool is_valid_uuid(const std::string& text);
bool is_valid_user_name(const std::string& name);
bool is_valid_machine_id(const std::string& id);
bool is_valid_unit_name(const std::string& name);

/**
 * @brief Generates a random version 4 UUID
 */
std::string new_uuid();

} // namespace core
} // namespace modelmig

#endif // MODELMIG_CORE_TYPES_H_
