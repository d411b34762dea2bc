#include "modelmig/storage/txn.h"
#include <sstream>

namespace modelmig {
namespace storage {

TxnOp TxnOp::Insert(const std::string& collection, const std::string& id, Document doc) {
    TxnOp op;
    op.collection = collection;
    op.id = id;
    op.effect = Effect::INSERT;
    op.doc_assert = DocAssert::DOC_MISSING;
    op.document = std::move(doc);
    return op;
}

TxnOp TxnOp::Update(const std::string& collection, const std::string& id, Document set) {
    TxnOp op;
    op.collection = collection;
    op.id = id;
    op.effect = Effect::UPDATE;
    op.doc_assert = DocAssert::DOC_EXISTS;
    op.document = std::move(set);
    return op;
}

TxnOp TxnOp::Remove(const std::string& collection, const std::string& id) {
    TxnOp op;
    op.collection = collection;
    op.id = id;
    op.effect = Effect::REMOVE;
    op.doc_assert = DocAssert::DOC_EXISTS;
    return op;
}

TxnOp TxnOp::Assert(const std::string& collection, const std::string& id) {
    TxnOp op;
    op.collection = collection;
    op.id = id;
    op.effect = Effect::ASSERT_ONLY;
    return op;
}

TxnOp& TxnOp::assert_missing() {
    doc_assert = DocAssert::DOC_MISSING;
    return *this;
}

TxnOp& TxnOp::assert_exists() {
    doc_assert = DocAssert::DOC_EXISTS;
    return *this;
}

TxnOp& TxnOp::assert_null(const std::string& field) {
    field_asserts.push_back({field, Value(std::monostate{})});
    return *this;
}

TxnOp& TxnOp::assert_int(const std::string& field, int64_t expected) {
    field_asserts.push_back({field, Value(std::in_place_type<int64_t>, expected)});
    return *this;
}

TxnOp& TxnOp::assert_string(const std::string& field, const std::string& expected) {
    field_asserts.push_back({field, Value(std::in_place_type<std::string>, expected)});
    return *this;
}

TxnOp& TxnOp::assert_revision(uint64_t revision) {
    revision_assert = revision;
    return *this;
}

TxnOp& TxnOp::unset(const std::string& field) {
    unset_fields.push_back(field);
    return *this;
}

TxnOp& TxnOp::increment(const std::string& field, int64_t delta) {
    increments.emplace_back(field, delta);
    return *this;
}

const char* effect_name(TxnOp::Effect effect) {
    switch (effect) {
        case TxnOp::Effect::ASSERT_ONLY: return "assert";
        case TxnOp::Effect::INSERT: return "insert";
        case TxnOp::Effect::UPDATE: return "update";
        case TxnOp::Effect::REMOVE: return "remove";
    }
    return "unknown";
}

std::string TxnOp::describe() const {
    std::ostringstream oss;
    oss << effect_name(effect) << " " << collection << "/" << id;
    for (const auto& fa : field_asserts) {
        oss << " [" << fa.field << "==" << value_to_string(fa.expected) << "]";
    }
    if (revision_assert) {
        oss << " [rev==" << *revision_assert << "]";
    }
    for (const auto& [field, delta] : increments) {
        oss << " {" << field << "+=" << delta << "}";
    }
    return oss.str();
}

} // namespace storage
} // namespace modelmig
