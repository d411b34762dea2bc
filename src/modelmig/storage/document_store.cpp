#include "modelmig/storage/document_store.h"
#include <algorithm>
#include <map>
#include <optional>
#include "modelmig/common/logger.h"

namespace modelmig {
namespace storage {

namespace {
// Set while a before-transaction hook runs on this thread
thread_local bool in_txn_hook = false;
} // namespace

DocumentStore::DocumentStore(const core::StoreConfig& config)
    : config_(config) {
}

DocumentStore::~DocumentStore() {
    if (open_.load()) {
        auto result = close();
        if (!result.ok()) {
            MODELMIG_WARN("DocumentStore close on destruction failed: {}", result.error());
        }
    }
}

core::Result<void> DocumentStore::open() {
    if (open_.load()) {
        return core::Result<void>::error("DocumentStore already open", core::Error::Code::INTERNAL);
    }

    if (!config_.data_dir.empty()) {
        journal_ = std::make_unique<TxnJournal>(
            config_.data_dir, config_.journal_segment_bytes, config_.sync_journal);

        size_t replayed = 0;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto replay_result = journal_->replay([this, &replayed](const JournalEntry& entry) {
                apply_entry(entry);
                replayed++;
            });
            if (!replay_result.ok()) {
                return replay_result;
            }
        }

        auto open_result = journal_->open();
        if (!open_result.ok()) {
            return open_result;
        }
        MODELMIG_INFO("DocumentStore opened at {}: replayed {} transactions (revision {})",
                      config_.data_dir, replayed, revision());
    }

    open_.store(true);
    return core::Result<void>();
}

core::Result<void> DocumentStore::close() {
    if (!open_.exchange(false)) {
        return core::Result<void>();
    }
    if (journal_) {
        auto result = journal_->flush();
        journal_->close();
        if (!result.ok()) {
            return result;
        }
    }
    return core::Result<void>();
}

const Document* DocumentStore::lookup(const std::string& collection, const std::string& id) const {
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) {
        return nullptr;
    }
    auto dit = cit->second.find(id);
    if (dit == cit->second.end()) {
        return nullptr;
    }
    return &dit->second;
}

core::Result<Document> DocumentStore::find(const std::string& collection, const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Document* doc = lookup(collection, id);
    if (doc == nullptr) {
        return core::NotFoundError(collection + "/" + id + " not found");
    }
    return *doc;
}

core::Result<std::vector<DocumentStore::Entry>> DocumentStore::find_all(
    const std::string& collection, const Predicate& predicate) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Entry> result;
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) {
        return result;
    }
    for (const auto& [id, doc] : cit->second) {
        if (!predicate || predicate(id, doc)) {
            result.emplace_back(id, doc);
        }
    }
    // flat_hash_map iteration order is unspecified
    std::sort(result.begin(), result.end(),
              [](const Entry& a, const Entry& b) { return a.first < b.first; });
    return result;
}

size_t DocumentStore::count(const std::string& collection) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto cit = collections_.find(collection);
    return cit == collections_.end() ? 0 : cit->second.size();
}

uint64_t DocumentStore::revision() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return revision_;
}

core::Result<void> DocumentStore::check_assertions(const TxnOp& op, const Document* current) const {
    auto aborted = [&op]() {
        return core::TxnAbortedError("transaction aborted: assertion failed on " + op.describe());
    };

    if (op.doc_assert == DocAssert::DOC_MISSING && current != nullptr) {
        return aborted();
    }
    if (op.doc_assert == DocAssert::DOC_EXISTS && current == nullptr) {
        return aborted();
    }
    if ((!op.field_asserts.empty() || op.revision_assert) && current == nullptr) {
        return aborted();
    }
    for (const auto& fa : op.field_asserts) {
        const Value* stored = current->get(fa.field);
        if (stored == nullptr) {
            if (!std::holds_alternative<std::monostate>(fa.expected)) {
                return aborted();
            }
        } else if (*stored != fa.expected) {
            return aborted();
        }
    }
    if (op.revision_assert && current->revision() != *op.revision_assert) {
        return aborted();
    }
    return core::Result<void>();
}

core::Result<void> DocumentStore::run_transaction(const TxnOps& ops) {
    if (!open_.load()) {
        return core::InternalError("document store is not open");
    }
    if (ops.empty()) {
        return core::Result<void>();
    }

    run_next_hook();

    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (const auto& op : ops) {
        auto check = check_assertions(op, lookup(op.collection, op.id));
        if (!check.ok()) {
            MODELMIG_DEBUG("{}", check.error());
            return check;
        }
    }

    // Stage the effects so a journal failure leaves the store untouched
    using Key = std::pair<std::string, std::string>;
    std::map<Key, std::optional<Document>> staged;
    std::vector<Key> order;
    uint64_t revision = revision_ + 1;

    auto current_of = [&](const Key& key) -> const Document* {
        auto sit = staged.find(key);
        if (sit != staged.end()) {
            return sit->second ? &*sit->second : nullptr;
        }
        return lookup(key.first, key.second);
    };
    auto stage = [&](const Key& key, std::optional<Document> doc) {
        if (staged.find(key) == staged.end()) {
            order.push_back(key);
        }
        staged[key] = std::move(doc);
    };

    for (const auto& op : ops) {
        Key key(op.collection, op.id);
        switch (op.effect) {
            case TxnOp::Effect::ASSERT_ONLY:
                break;
            case TxnOp::Effect::INSERT: {
                Document doc = op.document;
                doc.set_revision(revision);
                stage(key, std::move(doc));
                break;
            }
            case TxnOp::Effect::UPDATE: {
                const Document* base = current_of(key);
                if (base == nullptr) {
                    return core::TxnAbortedError("transaction aborted: " + op.describe() +
                                                 " targets a document removed earlier in the transaction");
                }
                Document doc = *base;
                for (const auto& [field, value] : op.document.fields()) {
                    doc.set_value(field, value);
                }
                for (const auto& field : op.unset_fields) {
                    doc.remove(field);
                }
                for (const auto& [field, delta] : op.increments) {
                    doc.set_int(field, doc.int_or(field, 0) + delta);
                }
                doc.set_revision(revision);
                stage(key, std::move(doc));
                break;
            }
            case TxnOp::Effect::REMOVE:
                stage(key, std::nullopt);
                break;
        }
    }

    if (order.empty()) {
        // Assertions only
        return core::Result<void>();
    }

    JournalEntry entry;
    entry.revision = revision;
    ChangeBatch batch;
    batch.revision = revision;
    for (const auto& key : order) {
        const auto& doc = staged[key];
        JournalEntry::Write write;
        write.collection = key.first;
        write.id = key.second;
        write.removed = !doc.has_value();
        if (doc) {
            write.document = *doc;
        }
        entry.writes.push_back(std::move(write));
        batch.changes.push_back(Change{key.first, key.second, revision, !doc.has_value()});
    }

    if (journal_) {
        auto logged = journal_->append(entry);
        if (!logged.ok()) {
            MODELMIG_ERROR("Transaction {} not committed: {}", revision, logged.error());
            return logged;
        }
    }

    for (const auto& key : order) {
        auto& doc = staged[key];
        if (doc) {
            collections_[key.first][key.second] = std::move(*doc);
        } else {
            auto cit = collections_.find(key.first);
            if (cit != collections_.end()) {
                cit->second.erase(key.second);
            }
        }
    }
    revision_ = revision;

    // Published under the store lock so subscribers see commit order
    hub_.publish(std::move(batch));
    return core::Result<void>();
}

core::Result<void> DocumentStore::compact() {
    if (!journal_) {
        return core::Result<void>();
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    JournalEntry snapshot;
    snapshot.revision = revision_;
    snapshot.snapshot = true;
    for (const auto& [collection, docs] : collections_) {
        for (const auto& [id, doc] : docs) {
            JournalEntry::Write write;
            write.collection = collection;
            write.id = id;
            write.document = doc;
            snapshot.writes.push_back(std::move(write));
        }
    }
    auto result = journal_->rewrite(snapshot);
    if (result.ok()) {
        MODELMIG_INFO("Journal compacted to {} documents at revision {}", snapshot.writes.size(), revision_);
    }
    return result;
}

void DocumentStore::apply_entry(const JournalEntry& entry) {
    if (entry.snapshot) {
        collections_.clear();
    }
    for (const auto& write : entry.writes) {
        if (write.removed) {
            auto cit = collections_.find(write.collection);
            if (cit != collections_.end()) {
                cit->second.erase(write.id);
            }
        } else {
            collections_[write.collection][write.id] = write.document;
        }
    }
    revision_ = std::max(revision_, entry.revision);
}

void DocumentStore::add_before_txn_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    hooks_.push_back(std::move(hook));
}

size_t DocumentStore::pending_hooks() const {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    return hooks_.size();
}

void DocumentStore::run_next_hook() {
    if (in_txn_hook) {
        return;
    }
    std::function<void()> hook;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        if (hooks_.empty()) {
            return;
        }
        hook = std::move(hooks_.front());
        hooks_.pop_front();
    }
    // Reset on every exit, including a throwing hook
    struct HookScope {
        HookScope() { in_txn_hook = true; }
        ~HookScope() { in_txn_hook = false; }
    } scope;
    hook();
}

TransactionRunner::TransactionRunner(std::shared_ptr<DocumentStore> store, int max_attempts)
    : store_(std::move(store)), max_attempts_(std::max(1, max_attempts)) {
}

core::Result<void> TransactionRunner::run(const Builder& builder) {
    for (int attempt = 0; attempt < max_attempts_; ++attempt) {
        auto ops = builder(attempt);
        if (!ops.ok()) {
            return ops.err();
        }
        if (ops.value().empty()) {
            return core::Result<void>();
        }
        auto result = store_->run_transaction(ops.value());
        if (result.ok()) {
            return result;
        }
        if (!result.is(core::Error::Code::TXN_ABORTED)) {
            return result;
        }
        MODELMIG_DEBUG("Transaction attempt {} aborted, rebuilding", attempt);
    }
    return core::ExcessiveContentionError("state changing too quickly; try again soon");
}

} // namespace storage
} // namespace modelmig
