#ifndef MODELMIG_STORAGE_DOCUMENT_STORE_H_
#define MODELMIG_STORAGE_DOCUMENT_STORE_H_

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "modelmig/core/config.h"
#include "modelmig/core/result.h"
#include "modelmig/storage/change_hub.h"
#include "modelmig/storage/document.h"
#include "modelmig/storage/txn.h"
#include "modelmig/storage/txn_journal.h"

namespace modelmig {
namespace storage {

/**
 * @brief Versioned document store with assert-and-set transactions
 *
 * A transaction is a list of TxnOps applied all-or-nothing: every
 * assertion is checked against the current state and, if any fails,
 * nothing is written and TXN_ABORTED is returned. Each commit bumps the
 * store revision, is appended to the journal when one is configured, and
 * is published to the change hub as one batch.
 */
class DocumentStore {
public:
    using Entry = std::pair<std::string, Document>;
    using Predicate = std::function<bool(const std::string& id, const Document& doc)>;

    explicit DocumentStore(const core::StoreConfig& config = core::StoreConfig::Default());
    ~DocumentStore();

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    /**
     * @brief Replays the journal when data_dir is set; a no-op otherwise
     */
    core::Result<void> open();
    core::Result<void> close();
    bool is_open() const { return open_.load(); }

    core::Result<Document> find(const std::string& collection, const std::string& id) const;
    core::Result<std::vector<Entry>> find_all(const std::string& collection,
                                              const Predicate& predicate = nullptr) const;
    size_t count(const std::string& collection) const;

    core::Result<void> run_transaction(const TxnOps& ops);

    /**
     * @brief Rewrites the journal as a single snapshot of every live document
     */
    core::Result<void> compact();

    ChangeHub& hub() { return hub_; }
    uint64_t revision() const;
    const core::StoreConfig& config() const { return config_; }

    /**
     * @brief Runs `hook` right before the next transaction checks its
     * assertions. Hooks are consumed one per transaction in FIFO order, so
     * a transaction issued from inside a hook does not trigger the next one.
     */
    void add_before_txn_hook(std::function<void()> hook);
    size_t pending_hooks() const;

private:
    using Collection = absl::flat_hash_map<std::string, Document>;

    core::StoreConfig config_;
    absl::flat_hash_map<std::string, Collection> collections_;
    uint64_t revision_ = 0;
    mutable std::shared_mutex mutex_;  // Protects collections_ and revision_
    std::atomic<bool> open_{false};

    std::unique_ptr<TxnJournal> journal_;
    ChangeHub hub_;

    std::deque<std::function<void()>> hooks_;
    mutable std::mutex hooks_mutex_;

    const Document* lookup(const std::string& collection, const std::string& id) const;
    core::Result<void> check_assertions(const TxnOp& op, const Document* current) const;
    void apply_entry(const JournalEntry& entry);
    void run_next_hook();
};

/**
 * @brief Runs transactions built by a callback, rebuilding them when an
 * assertion fails
 *
 * The builder receives the attempt number (0 first). From attempt 1 on it
 * should re-read state and return a definitive error if the operation can
 * no longer succeed. Returning no operations ends the run successfully
 * without writing. After max_attempts aborted commits the run fails with
 * EXCESSIVE_CONTENTION.
 */
class TransactionRunner {
public:
    using Builder = std::function<core::Result<TxnOps>(int attempt)>;

    TransactionRunner(std::shared_ptr<DocumentStore> store, int max_attempts);

    core::Result<void> run(const Builder& builder);

private:
    std::shared_ptr<DocumentStore> store_;
    int max_attempts_;
};

} // namespace storage
} // namespace modelmig

#endif // MODELMIG_STORAGE_DOCUMENT_STORE_H_
