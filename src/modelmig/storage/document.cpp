#include "modelmig/storage/document.h"
#include <sstream>

namespace modelmig {
namespace storage {

Document& Document::set_null(const std::string& field) {
    fields_[field] = Value(std::monostate{});
    return *this;
}

Document& Document::set_bool(const std::string& field, bool value) {
    fields_[field] = Value(std::in_place_type<bool>, value);
    return *this;
}

Document& Document::set_int(const std::string& field, int64_t value) {
    fields_[field] = Value(std::in_place_type<int64_t>, value);
    return *this;
}

Document& Document::set_string(const std::string& field, const std::string& value) {
    fields_[field] = Value(std::in_place_type<std::string>, value);
    return *this;
}

Document& Document::set_strings(const std::string& field, const std::vector<std::string>& value) {
    fields_[field] = Value(std::in_place_type<std::vector<std::string>>, value);
    return *this;
}

Document& Document::set_value(const std::string& field, const Value& value) {
    fields_[field] = value;
    return *this;
}

void Document::remove(const std::string& field) {
    fields_.erase(field);
}

bool Document::has(const std::string& field) const {
    return fields_.find(field) != fields_.end();
}

const Value* Document::get(const std::string& field) const {
    auto it = fields_.find(field);
    if (it == fields_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<bool> Document::get_bool(const std::string& field) const {
    const Value* value = get(field);
    if (value == nullptr || !std::holds_alternative<bool>(*value)) {
        return std::nullopt;
    }
    return std::get<bool>(*value);
}

std::optional<int64_t> Document::get_int(const std::string& field) const {
    const Value* value = get(field);
    if (value == nullptr || !std::holds_alternative<int64_t>(*value)) {
        return std::nullopt;
    }
    return std::get<int64_t>(*value);
}

std::optional<std::string> Document::get_string(const std::string& field) const {
    const Value* value = get(field);
    if (value == nullptr || !std::holds_alternative<std::string>(*value)) {
        return std::nullopt;
    }
    return std::get<std::string>(*value);
}

std::optional<std::vector<std::string>> Document::get_strings(const std::string& field) const {
    const Value* value = get(field);
    if (value == nullptr || !std::holds_alternative<std::vector<std::string>>(*value)) {
        return std::nullopt;
    }
    return std::get<std::vector<std::string>>(*value);
}

bool Document::bool_or(const std::string& field, bool fallback) const {
    return get_bool(field).value_or(fallback);
}

int64_t Document::int_or(const std::string& field, int64_t fallback) const {
    return get_int(field).value_or(fallback);
}

std::string Document::string_or(const std::string& field, const std::string& fallback) const {
    return get_string(field).value_or(fallback);
}

std::string value_to_string(const Value& value) {
    std::ostringstream oss;
    if (std::holds_alternative<std::monostate>(value)) {
        oss << "null";
    } else if (std::holds_alternative<bool>(value)) {
        oss << (std::get<bool>(value) ? "true" : "false");
    } else if (std::holds_alternative<int64_t>(value)) {
        oss << std::get<int64_t>(value);
    } else if (std::holds_alternative<std::string>(value)) {
        oss << '"' << std::get<std::string>(value) << '"';
    } else {
        const auto& list = std::get<std::vector<std::string>>(value);
        oss << '[';
        for (size_t i = 0; i < list.size(); ++i) {
            if (i > 0) {
                oss << ", ";
            }
            oss << '"' << list[i] << '"';
        }
        oss << ']';
    }
    return oss.str();
}

} // namespace storage
} // namespace modelmig
