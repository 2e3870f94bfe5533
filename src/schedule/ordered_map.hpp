#pragma once

#include <cstddef>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// InsertionOrderedMap - iteration follows first-insertion order.
// ---------------------------------------------------------------------------
template <typename K, typename V>
class InsertionOrderedMap {
public:
    using value_type = std::pair<K, V>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    // Inserts (key, value) only if key is absent. Returns the stored value.
    V& try_emplace(const K& key, V value) {
        auto it = index_.find(key);
        if (it != index_.end()) return entries_[it->second].second;
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, std::move(value));
        return entries_.back().second;
    }

    // Default-constructs the value on first access.
    V& operator[](const K& key) { return try_emplace(key, V{}); }

    bool contains(const K& key) const { return index_.count(key) > 0; }

    const V& at(const K& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) throw std::out_of_range("InsertionOrderedMap::at");
        return entries_[it->second].second;
    }

    const V* find(const K& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const InsertionOrderedMap& other) const { return entries_ == other.entries_; }

private:
    std::vector<value_type> entries_;
    std::unordered_map<K, size_t> index_;
};
