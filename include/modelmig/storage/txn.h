#ifndef MODELMIG_STORAGE_TXN_H_
#define MODELMIG_STORAGE_TXN_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "modelmig/storage/document.h"

namespace modelmig {
namespace storage {

/**
 * @brief Document-level precondition of a transaction operation
 */
enum class DocAssert {
    NONE,
    DOC_MISSING,
    DOC_EXISTS
};

/**
 * @brief Field-level precondition: the stored field must equal `expected`.
 * A missing field only matches a null expectation.
 */
struct FieldAssert {
    std::string field;
    Value expected;
};

/**
 * @brief One operation of an assert-and-set transaction
 *
 * Every assertion of every operation is checked against the state before
 * the transaction; the effects are applied only when all of them hold.
 * INSERT implies DOC_MISSING, UPDATE and REMOVE imply DOC_EXISTS.
 */
struct TxnOp {
    enum class Effect {
        ASSERT_ONLY,
        INSERT,
        UPDATE,
        REMOVE
    };

    std::string collection;
    std::string id;
    Effect effect = Effect::ASSERT_ONLY;
    DocAssert doc_assert = DocAssert::NONE;
    std::vector<FieldAssert> field_asserts;
    std::optional<uint64_t> revision_assert;
    Document document;                    // INSERT: whole document, UPDATE: fields to set
    std::vector<std::string> unset_fields;
    std::vector<std::pair<std::string, int64_t>> increments;  // UPDATE: added to int fields, missing counts as 0

    static TxnOp Insert(const std::string& collection, const std::string& id, Document doc);
    static TxnOp Update(const std::string& collection, const std::string& id, Document set);
    static TxnOp Remove(const std::string& collection, const std::string& id);
    static TxnOp Assert(const std::string& collection, const std::string& id);

    TxnOp& assert_missing();
    TxnOp& assert_exists();
    TxnOp& assert_null(const std::string& field);
    TxnOp& assert_int(const std::string& field, int64_t expected);
    TxnOp& assert_string(const std::string& field, const std::string& expected);
    TxnOp& assert_revision(uint64_t revision);
    TxnOp& unset(const std::string& field);
    TxnOp& increment(const std::string& field, int64_t delta = 1);

    std::string describe() const;
};

using TxnOps = std::vector<TxnOp>;

const char* effect_name(TxnOp::Effect effect);

} // namespace storage
} // namespace modelmig

#endif // MODELMIG_STORAGE_TXN_H_
