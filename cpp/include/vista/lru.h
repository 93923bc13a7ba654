#pragma once

#include <cstddef>
#include <list>
#include <map>
#include <utility>

namespace vista {

/// Key-value map holding at most `capacity` entries. Inserting past the
/// capacity discards the least recently used entry. Not synchronized;
/// owners lock around it.
template <class Key, class Value>
class LruMap {
public:
    explicit LruMap(size_t capacity) : capacity_(capacity) {}

    /// Pointer to the value for `key`, or nullptr. A hit becomes the most
    /// recently used entry.
    const Value* find(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) return nullptr;
        order_.splice(order_.begin(), order_, it->second);
        return &it->second->second;
    }

    /// Insert or replace, then evict down to the capacity.
    void insert(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        order_.emplace_front(key, std::move(value));
        index_.emplace(key, order_.begin());
        while (order_.size() > capacity_) {
            index_.erase(order_.back().first);
            order_.pop_back();
        }
    }

    size_t size() const { return order_.size(); }
    size_t capacity() const { return capacity_; }

private:
    using Order = std::list<std::pair<Key, Value>>;

    size_t capacity_;
    Order order_;
    std::map<Key, typename Order::iterator> index_;
};

} // namespace vista
