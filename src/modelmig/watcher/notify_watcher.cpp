#include "modelmig/watcher/notify_watcher.h"
#include "modelmig/common/logger.h"

namespace modelmig {
namespace watcher {

const char* watch_event_name(WatchEvent event) {
    switch (event) {
        case WatchEvent::CHANGED: return "CHANGED";
        case WatchEvent::TIMEOUT: return "TIMEOUT";
        case WatchEvent::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

DocumentWatcher::DocumentWatcher(std::shared_ptr<storage::DocumentStore> store,
                                 std::string name,
                                 Filter filter,
                                 Check check)
    : store_(std::move(store)),
      name_(std::move(name)),
      filter_(std::move(filter)),
      check_(std::move(check)),
      inbox_(std::make_shared<Inbox>()) {
}

DocumentWatcher::~DocumentWatcher() {
    if (started_.load()) {
        auto result = stop();
        if (!result.ok()) {
            MODELMIG_DEBUG("Watcher {} stopped with error: {}", name_, result.error());
        }
    }
}

core::Result<void> DocumentWatcher::start() {
    if (started_.exchange(true)) {
        return core::InternalError("watcher " + name_ + " already started");
    }

    // Subscribe before priming so no commit falls between the two
    auto inbox = inbox_;
    auto id = store_->hub().subscribe([inbox](const storage::ChangeHub::BatchPtr& batch) {
        std::lock_guard<std::mutex> lock(inbox->mutex);
        if (inbox->closed) {
            return;
        }
        inbox->batches.push_back(batch);
        inbox->cv.notify_one();
    });
    {
        std::lock_guard<std::mutex> lock(subscription_mutex_);
        subscription_ = id;
    }

    if (check_) {
        auto primed = check_();
        if (!primed.ok()) {
            unsubscribe();
            std::lock_guard<std::mutex> lock(out_mutex_);
            closed_ = true;
            error_ = primed.err();
            return primed.err().annotate("cannot start watcher " + name_);
        }
    }

    {
        std::lock_guard<std::mutex> lock(out_mutex_);
        pending_ = true;
    }
    loop_thread_ = std::thread(&DocumentWatcher::loop, this);
    MODELMIG_DEBUG("Watcher {} started", name_);
    return core::Result<void>();
}

void DocumentWatcher::loop() {
    while (true) {
        std::deque<storage::ChangeHub::BatchPtr> batches;
        {
            std::unique_lock<std::mutex> lock(inbox_->mutex);
            inbox_->cv.wait(lock, [this] { return inbox_->closed || !inbox_->batches.empty(); });
            if (inbox_->closed) {
                return;
            }
            batches.swap(inbox_->batches);
        }

        bool relevant = false;
        for (const auto& batch : batches) {
            for (const auto& change : batch->changes) {
                if (filter_(change)) {
                    relevant = true;
                    break;
                }
            }
            if (relevant) {
                break;
            }
        }
        if (!relevant) {
            continue;
        }

        if (check_) {
            auto changed = check_();
            if (!changed.ok()) {
                kill(changed.err());
                return;
            }
            if (!changed.value()) {
                continue;
            }
        }
        notify();
    }
}

void DocumentWatcher::notify() {
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (closed_) {
        return;
    }
    pending_ = true;
    out_cv_.notify_all();
}

void DocumentWatcher::kill(const core::Error& error) {
    MODELMIG_WARN("Watcher {} terminated: {}", name_, error.what());
    unsubscribe();
    {
        std::lock_guard<std::mutex> lock(inbox_->mutex);
        inbox_->closed = true;
        inbox_->batches.clear();
    }
    std::lock_guard<std::mutex> lock(out_mutex_);
    error_ = error;
    closed_ = true;
    out_cv_.notify_all();
}

WatchEvent DocumentWatcher::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(out_mutex_);
    out_cv_.wait_for(lock, timeout, [this] { return pending_ || closed_; });
    if (closed_) {
        return WatchEvent::CLOSED;
    }
    if (pending_) {
        pending_ = false;
        return WatchEvent::CHANGED;
    }
    return WatchEvent::TIMEOUT;
}

void DocumentWatcher::unsubscribe() {
    std::optional<storage::ChangeHub::SubscriptionId> id;
    {
        std::lock_guard<std::mutex> lock(subscription_mutex_);
        id.swap(subscription_);
    }
    // Not under subscription_mutex_: the hub may be mid-publish into our inbox
    if (id) {
        store_->hub().unsubscribe(*id);
    }
}

core::Result<void> DocumentWatcher::stop() {
    unsubscribe();
    {
        std::lock_guard<std::mutex> lock(inbox_->mutex);
        inbox_->closed = true;
        inbox_->batches.clear();
    }
    inbox_->cv.notify_all();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    std::lock_guard<std::mutex> lock(out_mutex_);
    closed_ = true;
    pending_ = false;
    out_cv_.notify_all();
    if (error_) {
        return *error_;
    }
    return core::Result<void>();
}

bool DocumentWatcher::stopped() const {
    std::lock_guard<std::mutex> lock(out_mutex_);
    return closed_;
}

core::Result<void> DocumentWatcher::err() const {
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (error_) {
        return *error_;
    }
    return core::Result<void>();
}

} // namespace watcher
} // namespace modelmig
