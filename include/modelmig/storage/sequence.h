#ifndef MODELMIG_STORAGE_SEQUENCE_H_
#define MODELMIG_STORAGE_SEQUENCE_H_

#include <cstdint>
#include <memory>
#include <string>

#include "modelmig/core/result.h"
#include "modelmig/storage/document_store.h"

namespace modelmig {
namespace storage {

/**
 * @brief A sequence value together with the operations that consume it
 *
 * The value is only consumed if `ops` commit; run them in the same
 * transaction as the write that uses the value.
 */
struct SequenceClaim {
    int64_t value = 0;
    TxnOps ops;
};

/**
 * @brief Per-scope monotonically increasing counters starting at 0
 *
 * Counters live in the "sequences" collection under "<scope>:<name>".
 * Distinct scopes never share or contend on a counter.
 */
class SequenceGenerator {
public:
    static constexpr const char* kCollection = "sequences";

    explicit SequenceGenerator(std::shared_ptr<DocumentStore> store, int max_txn_attempts = 3);

    core::Result<SequenceClaim> claim(const std::string& scope, const std::string& name) const;

    // Claims and commits in one step
    core::Result<int64_t> next(const std::string& scope, const std::string& name);

    // The value the next claim would return; does not consume it
    core::Result<int64_t> current(const std::string& scope, const std::string& name) const;

    static std::string sequence_id(const std::string& scope, const std::string& name);

private:
    std::shared_ptr<DocumentStore> store_;
    int max_txn_attempts_;
};

} // namespace storage
} // namespace modelmig

#endif // MODELMIG_STORAGE_SEQUENCE_H_
