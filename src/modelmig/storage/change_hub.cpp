#include "modelmig/storage/change_hub.h"

namespace modelmig {
namespace storage {

ChangeHub::SubscriptionId ChangeHub::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.emplace(id, std::move(subscriber));
    return id;
}

void ChangeHub::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(id);
}

void ChangeHub::publish(ChangeBatch batch) {
    if (batch.changes.empty()) {
        return;
    }
    auto shared = std::make_shared<const ChangeBatch>(std::move(batch));

    std::lock_guard<std::mutex> lock(mutex_);
    published_++;
    for (const auto& [id, subscriber] : subscribers_) {
        subscriber(shared);
    }
}

size_t ChangeHub::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

uint64_t ChangeHub::published_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

} // namespace storage
} // namespace modelmig
