/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <list>
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace nexus::subscription {

  template <typename Key, typename... Arguments>
  class Subscriber;

  using SubscriptionSetId = uint32_t;

  /**
   * Dispatches notifications keyed by `Key` to every subscriber registered
   * for that key. Subscribers are held weakly and dropped once expired.
   * @tparam Key event kind
   * @tparam EventParams payload passed to subscribers
   */
  template <typename Key, typename... EventParams>
  class SubscriptionEngine final
      : public std::enable_shared_from_this<
            SubscriptionEngine<Key, EventParams...>> {
   public:
    using KeyType = Key;
    using SubscriberType = Subscriber<KeyType, EventParams...>;
    using SubscriberWeakPtr = std::weak_ptr<SubscriberType>;

    /// List is preferable here because this container iterators remain
    /// alive after removal from the middle of the container
    using SubscribersContainer =
        std::list<std::pair<SubscriptionSetId, SubscriberWeakPtr>>;
    using IteratorType = typename SubscribersContainer::iterator;

    SubscriptionEngine() = default;

    SubscriptionEngine(const SubscriptionEngine &) = delete;
    SubscriptionEngine &operator=(const SubscriptionEngine &) = delete;

   private:
    template <typename K, typename... Args>
    friend class Subscriber;

    mutable std::shared_mutex subscribers_map_cs_;
    std::map<KeyType, SubscribersContainer> subscribers_map_;

    IteratorType subscribe(SubscriptionSetId set_id,
                           const KeyType &key,
                           SubscriberWeakPtr ptr) {
      std::unique_lock lock(subscribers_map_cs_);
      auto &subscribers_list = subscribers_map_[key];
      return subscribers_list.emplace(subscribers_list.end(),
                                      std::make_pair(set_id, std::move(ptr)));
    }

    void unsubscribe(const KeyType &key, const IteratorType &it_remove) {
      std::unique_lock lock(subscribers_map_cs_);
      auto it = subscribers_map_.find(key);
      if (subscribers_map_.end() != it) {
        it->second.erase(it_remove);
        if (it->second.empty()) {
          subscribers_map_.erase(it);
        }
      }
    }

   public:
    size_t size(const KeyType &key) const {
      std::shared_lock lock(subscribers_map_cs_);
      if (auto it = subscribers_map_.find(key); it != subscribers_map_.end()) {
        return it->second.size();
      }
      return 0ull;
    }

    void notify(const KeyType &key, const EventParams &...args) {
      std::vector<std::pair<SubscriptionSetId, std::shared_ptr<SubscriberType>>>
          alive;
      {
        std::shared_lock lock(subscribers_map_cs_);
        auto it = subscribers_map_.find(key);
        if (subscribers_map_.end() == it) {
          return;
        }
        for (auto &[set_id, weak] : it->second) {
          if (auto sub = weak.lock()) {
            alive.emplace_back(set_id, std::move(sub));
          }
        }
      }
      // callbacks run unlocked, so they may subscribe or unsubscribe
      for (auto &[set_id, sub] : alive) {
        sub->on_notify(set_id, key, args...);
      }
    }
  };

}  // namespace nexus::subscription
