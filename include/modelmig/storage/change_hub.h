#ifndef MODELMIG_STORAGE_CHANGE_HUB_H_
#define MODELMIG_STORAGE_CHANGE_HUB_H_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace modelmig {
namespace storage {

/**
 * @brief One document written by a committed transaction
 */
struct Change {
    std::string collection;
    std::string id;
    uint64_t revision;
    bool removed;
};

/**
 * @brief Every document written by one committed transaction
 */
struct ChangeBatch {
    uint64_t revision = 0;
    std::vector<Change> changes;
};

/**
 * @brief Fans committed change batches out to subscribers
 *
 * Batches are delivered in commit order. Subscriber callbacks run on the
 * publishing thread while the hub lock is held, so they must only hand
 * the batch off (enqueue and signal) and never call back into the hub or
 * the store. Once unsubscribe() returns the callback is never invoked again.
 */
class ChangeHub {
public:
    using BatchPtr = std::shared_ptr<const ChangeBatch>;
    using Subscriber = std::function<void(const BatchPtr&)>;
    using SubscriptionId = uint64_t;

    ChangeHub() = default;
    ChangeHub(const ChangeHub&) = delete;
    ChangeHub& operator=(const ChangeHub&) = delete;

    SubscriptionId subscribe(Subscriber subscriber);
    void unsubscribe(SubscriptionId id);
    void publish(ChangeBatch batch);

    size_t subscriber_count() const;
    uint64_t published_count() const;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscriber> subscribers_;
    SubscriptionId next_id_ = 1;
    uint64_t published_ = 0;
};

} // namespace storage
} // namespace modelmig

#endif // MODELMIG_STORAGE_CHANGE_HUB_H_
