#include "modelmig/storage/sequence.h"

namespace modelmig {
namespace storage {

namespace {
const char* kCounterField = "counter";
const char* kScopeField = "scope";
const char* kNameField = "name";
} // namespace

SequenceGenerator::SequenceGenerator(std::shared_ptr<DocumentStore> store, int max_txn_attempts)
    : store_(std::move(store)), max_txn_attempts_(max_txn_attempts) {
}

std::string SequenceGenerator::sequence_id(const std::string& scope, const std::string& name) {
    return scope + ":" + name;
}

core::Result<SequenceClaim> SequenceGenerator::claim(const std::string& scope, const std::string& name) const {
    std::string id = sequence_id(scope, name);
    SequenceClaim claim;

    auto existing = store_->find(kCollection, id);
    if (!existing.ok()) {
        if (!existing.is(core::Error::Code::NOT_FOUND)) {
            return existing.err();
        }
        Document doc;
        doc.set_string(kScopeField, scope)
           .set_string(kNameField, name)
           .set_int(kCounterField, 1);
        claim.value = 0;
        claim.ops.push_back(TxnOp::Insert(kCollection, id, std::move(doc)));
        return claim;
    }

    auto counter = existing.value().get_int(kCounterField);
    if (!counter) {
        return core::InternalError("sequence " + id + " has no counter");
    }
    claim.value = *counter;

    Document set;
    set.set_int(kCounterField, *counter + 1);
    claim.ops.push_back(TxnOp::Update(kCollection, id, std::move(set)).assert_int(kCounterField, *counter));
    return claim;
}

core::Result<int64_t> SequenceGenerator::next(const std::string& scope, const std::string& name) {
    int64_t value = 0;
    TransactionRunner runner(store_, max_txn_attempts_);
    auto result = runner.run([&](int) -> core::Result<TxnOps> {
        auto claimed = claim(scope, name);
        if (!claimed.ok()) {
            return claimed.err();
        }
        value = claimed.value().value;
        return std::move(claimed.value().ops);
    });
    if (!result.ok()) {
        return result.err().annotate("cannot increment sequence " + sequence_id(scope, name));
    }
    return value;
}

core::Result<int64_t> SequenceGenerator::current(const std::string& scope, const std::string& name) const {
    auto existing = store_->find(kCollection, sequence_id(scope, name));
    if (!existing.ok()) {
        if (existing.is(core::Error::Code::NOT_FOUND)) {
            return static_cast<int64_t>(0);
        }
        return existing.err();
    }
    return existing.value().int_or(kCounterField, 0);
}

} // namespace storage
} // namespace modelmig
