/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "subscription/subscription_engine.hpp"

namespace nexus::subscription {

  /**
   * Receiving end of a SubscriptionEngine. Unsubscribes from everything on
   * destruction.
   * @tparam Key is a type of a subscription Key.
   * @tparam Arguments payload of a notification
   */
  template <typename Key, typename... Arguments>
  class Subscriber final
      : public std::enable_shared_from_this<Subscriber<Key, Arguments...>> {
   public:
    using KeyType = Key;
    using SubscriptionEngineType = SubscriptionEngine<KeyType, Arguments...>;
    using SubscriptionEnginePtr = std::shared_ptr<SubscriptionEngineType>;

    using CallbackFnType = std::function<void(
        SubscriptionSetId, const KeyType &, const Arguments &...)>;

   private:
    using SubscriptionsContainer =
        std::map<KeyType, typename SubscriptionEngineType::IteratorType>;
    using SubscriptionsSets =
        std::map<SubscriptionSetId, SubscriptionsContainer>;

    std::atomic<SubscriptionSetId> next_id_;
    SubscriptionEnginePtr engine_;

    std::mutex subscriptions_cs_;
    SubscriptionsSets subscriptions_sets_;

    CallbackFnType on_notify_callback_;

   public:
    explicit Subscriber(SubscriptionEnginePtr ptr)
        : next_id_(0), engine_(std::move(ptr)) {}

    ~Subscriber() {
      unsubscribe();
    }

    Subscriber(const Subscriber &) = delete;
    Subscriber &operator=(const Subscriber &) = delete;

    void setCallback(CallbackFnType &&f) {
      on_notify_callback_ = std::move(f);
    }

    SubscriptionSetId generateSubscriptionSetId() {
      return ++next_id_;
    }

    void subscribe(SubscriptionSetId id, const KeyType &key) {
      std::lock_guard lock(subscriptions_cs_);
      auto [it, inserted] = subscriptions_sets_[id].emplace(
          key, typename SubscriptionEngineType::IteratorType{});
      if (inserted) {
        it->second = engine_->subscribe(id, key, this->weak_from_this());
      }
    }

    void unsubscribe(SubscriptionSetId id) {
      std::lock_guard lock(subscriptions_cs_);
      if (auto set_it = subscriptions_sets_.find(id);
          set_it != subscriptions_sets_.end()) {
        for (auto &[key, it] : set_it->second) {
          engine_->unsubscribe(key, it);
        }
        subscriptions_sets_.erase(set_it);
      }
    }

    void unsubscribe() {
      std::lock_guard lock(subscriptions_cs_);
      for (auto &[_, subscriptions] : subscriptions_sets_) {
        for (auto &[key, it] : subscriptions) {
          engine_->unsubscribe(key, it);
        }
      }
      subscriptions_sets_.clear();
    }

    void on_notify(SubscriptionSetId set_id,
                   const KeyType &key,
                   const Arguments &...args) {
      if (nullptr != on_notify_callback_) {
        on_notify_callback_(set_id, key, args...);
      }
    }
  };

}  // namespace nexus::subscription
