#ifndef MODELMIG_WATCHER_NOTIFY_WATCHER_H_
#define MODELMIG_WATCHER_NOTIFY_WATCHER_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "modelmig/core/result.h"
#include "modelmig/storage/change_hub.h"
#include "modelmig/storage/document_store.h"

namespace modelmig {
namespace watcher {

/**
 * @brief Outcome of waiting on a watcher
 */
enum class WatchEvent {
    CHANGED,
    TIMEOUT,
    CLOSED
};

const char* watch_event_name(WatchEvent event);

/**
 * @brief Consumer side of a coalescing change notification
 *
 * Delivers one event when started, then at least one event after any
 * relevant change. Changes that arrive before the consumer waits again
 * are merged into a single pending event.
 */
class NotifyWatcher {
public:
    virtual ~NotifyWatcher() = default;

    // Blocks until an event is pending, the timeout passes or the watcher stops
    virtual WatchEvent wait(std::chrono::milliseconds timeout) = 0;

    // After stop() returns no further events are delivered
    virtual core::Result<void> stop() = 0;
    virtual bool stopped() const = 0;

    // The error that terminated the watcher, if any
    virtual core::Result<void> err() const = 0;
};

/**
 * @brief NotifyWatcher over a DocumentStore change feed
 *
 * A loop thread drains change batches from the store's hub. A batch with
 * at least one change accepted by `filter` wakes the consumer, unless a
 * `check` is given and decides, after re-reading state, that the change
 * is not interesting. A failing check terminates the watcher.
 */
class DocumentWatcher : public NotifyWatcher {
public:
    using Filter = std::function<bool(const storage::Change& change)>;
    using Check = std::function<core::Result<bool>()>;

    DocumentWatcher(std::shared_ptr<storage::DocumentStore> store,
                    std::string name,
                    Filter filter,
                    Check check = nullptr);
    ~DocumentWatcher() override;

    DocumentWatcher(const DocumentWatcher&) = delete;
    DocumentWatcher& operator=(const DocumentWatcher&) = delete;

    /**
     * @brief Subscribes to the hub, queues the initial event and starts the loop
     */
    core::Result<void> start();

    WatchEvent wait(std::chrono::milliseconds timeout) override;
    core::Result<void> stop() override;
    bool stopped() const override;
    core::Result<void> err() const override;

    const std::string& name() const { return name_; }

private:
    // Shared with the hub callback so it can outlive a stopping watcher
    struct Inbox {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<storage::ChangeHub::BatchPtr> batches;
        bool closed = false;
    };

    std::shared_ptr<storage::DocumentStore> store_;
    std::string name_;
    Filter filter_;
    Check check_;

    std::shared_ptr<Inbox> inbox_;
    std::mutex subscription_mutex_;   // stop() and a dying loop thread both unsubscribe
    std::optional<storage::ChangeHub::SubscriptionId> subscription_;
    std::thread loop_thread_;
    std::atomic<bool> started_{false};

    mutable std::mutex out_mutex_;
    std::condition_variable out_cv_;
    bool pending_ = false;
    bool closed_ = false;
    std::optional<core::Error> error_;

    void loop();
    void notify();
    void kill(const core::Error& error);
    void unsubscribe();
};

} // namespace watcher
} // namespace modelmig

#endif // MODELMIG_WATCHER_NOTIFY_WATCHER_H_
