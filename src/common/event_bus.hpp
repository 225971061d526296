#pragma once

#include "common/log.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace sightlink {

// ============================================================================
// Event Base Class
// ============================================================================

struct Event {
    virtual ~Event() = default;
    virtual std::type_index type() const = 0;
};

template<typename T>
struct TypedEvent : Event {
    std::type_index type() const override { return std::type_index(typeid(T)); }
};

namespace detail {

using EventHandler = std::function<void(const Event&)>;

// Subscriber table shared between the bus and its handles
struct SubscriberTable {
    std::unordered_map<std::type_index, std::map<uint64_t, std::shared_ptr<EventHandler>>> by_type;
    uint64_t next_id = 1;

    void remove(std::type_index type, uint64_t id) {
        auto it = by_type.find(type);
        if (it == by_type.end()) return;
        it->second.erase(id);
        if (it->second.empty()) {
            by_type.erase(it);
        }
    }
};

} // namespace detail

// ============================================================================
// Subscription Handle
// ============================================================================
// Unsubscribes on destruction. Outliving the bus is harmless.

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    SubscriptionHandle(std::weak_ptr<detail::SubscriberTable> table, std::type_index type, uint64_t id)
        : table_(std::move(table)), type_(type), id_(id) {}
    ~SubscriptionHandle() { unsubscribe(); }

    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    SubscriptionHandle(SubscriptionHandle&& other) noexcept
        : table_(std::move(other.table_)), type_(other.type_), id_(other.id_) {
        other.id_ = 0;
    }

    SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            table_ = std::move(other.table_);
            type_ = other.type_;
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }

    void unsubscribe() {
        if (id_ == 0) return;
        if (auto table = table_.lock()) {
            table->remove(type_, id_);
        }
        table_.reset();
        id_ = 0;
    }

    bool active() const { return id_ != 0 && !table_.expired(); }

private:
    std::weak_ptr<detail::SubscriberTable> table_;
    std::type_index type_{typeid(void)};
    uint64_t id_ = 0;
};

// ============================================================================
// Event Bus
// ============================================================================
// Synchronous: publish() runs every subscriber on the calling thread before
// returning. All publishers live on the tunnel's io_context thread.
class EventBus {
public:
    EventBus() : table_(std::make_shared<detail::SubscriberTable>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    [[nodiscard]] SubscriptionHandle subscribe(std::function<void(const EventType&)> handler) {
        auto type = std::type_index(typeid(EventType));
        uint64_t id = table_->next_id++;
        table_->by_type[type][id] = std::make_shared<detail::EventHandler>(
            [handler = std::move(handler)](const Event& e) {
                handler(static_cast<const EventType&>(e));
            });
        return SubscriptionHandle(table_, type, id);
    }

    // A subscriber removed by an earlier one in the same publish is skipped;
    // one added during publish sees the next event only
    template<typename EventType>
    void publish(const EventType& event) {
        auto type = std::type_index(typeid(EventType));
        auto it = table_->by_type.find(type);
        if (it == table_->by_type.end()) {
            return;
        }

        std::vector<std::weak_ptr<detail::EventHandler>> snapshot;
        snapshot.reserve(it->second.size());
        for (const auto& [id, handler] : it->second) {
            snapshot.push_back(handler);
        }

        for (const auto& weak : snapshot) {
            auto handler = weak.lock();
            if (!handler) {
                continue;
            }
            try {
                (*handler)(event);
            } catch (const std::exception& e) {
                LOG_ERROR("EventBus: subscriber for {} threw: {}", type.name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        auto it = table_->by_type.find(std::type_index(typeid(EventType)));
        return it == table_->by_type.end() ? 0 : it->second.size();
    }

private:
    std::shared_ptr<detail::SubscriberTable> table_;
};

} // namespace sightlink
