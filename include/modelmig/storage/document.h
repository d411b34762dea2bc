#ifndef MODELMIG_STORAGE_DOCUMENT_H_
#define MODELMIG_STORAGE_DOCUMENT_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace modelmig {
namespace storage {

/**
 * @brief A field value: null, bool, integer, string or list of strings
 */
using Value = std::variant<std::monostate, bool, int64_t, std::string, std::vector<std::string>>;

/**
 * @brief A schemaless record stored under (collection, id)
 *
 * Setters are typed on purpose: constructing a Value straight from a
 * string literal would select the bool alternative.
 */
class Document {
public:
    using Fields = std::map<std::string, Value>;

    Document() = default;

    Document& set_null(const std::string& field);
    Document& set_bool(const std::string& field, bool value);
    Document& set_int(const std::string& field, int64_t value);
    Document& set_string(const std::string& field, const std::string& value);
    Document& set_strings(const std::string& field, const std::vector<std::string>& value);
    Document& set_value(const std::string& field, const Value& value);
    void remove(const std::string& field);

    bool has(const std::string& field) const;
    const Value* get(const std::string& field) const;

    std::optional<bool> get_bool(const std::string& field) const;
    std::optional<int64_t> get_int(const std::string& field) const;
    std::optional<std::string> get_string(const std::string& field) const;
    std::optional<std::vector<std::string>> get_strings(const std::string& field) const;

    // Missing or differently typed fields read as the fallback
    bool bool_or(const std::string& field, bool fallback) const;
    int64_t int_or(const std::string& field, int64_t fallback) const;
    std::string string_or(const std::string& field, const std::string& fallback) const;

    const Fields& fields() const { return fields_; }
    bool empty() const { return fields_.empty(); }
    size_t size() const { return fields_.size(); }

    // Set by the store on every write
    uint64_t revision() const { return revision_; }
    void set_revision(uint64_t revision) { revision_ = revision; }

    // Compares fields only, not revisions
    bool operator==(const Document& other) const { return fields_ == other.fields_; }
    bool operator!=(const Document& other) const { return !(*this == other); }

private:
    Fields fields_;
    uint64_t revision_ = 0;
};

std::string value_to_string(const Value& value);

} // namespace storage
} // namespace modelmig

#endif // MODELMIG_STORAGE_DOCUMENT_H_
