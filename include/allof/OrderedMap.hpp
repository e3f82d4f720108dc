/**
 * @file OrderedMap.hpp
 * @brief Insertion-ordered associative container
 *
 * Used for schema properties and vendor extensions, where the order keys
 * were first seen decides the order of the merged output.
 *
 * Rules:
 * - set() on a new key appends it
 * - set() on an existing key replaces the value and keeps the key's position
 * - iteration follows insertion order
 */

#ifndef ALLOF_ORDEREDMAP_HPP
#define ALLOF_ORDEREDMAP_HPP

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace allof {

template <typename Key, typename T>
class OrderedMap {
public:
    using key_type = Key;
    using mapped_type = T;
    using value_type = std::pair<Key, T>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    OrderedMap() = default;

    OrderedMap(std::initializer_list<value_type> init) {
        for (const auto& entry : init) {
            set(entry.first, entry.second);
        }
    }

    /**
     * @brief Insert or replace the value for @p key
     * @return true if the key was new, false if an existing value was replaced
     */
    bool set(const Key& key, T value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return false;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, std::move(value));
        return true;
    }

    bool contains(const Key& key) const {
        return index_.find(key) != index_.end();
    }

    /**
     * @brief Look up a value
     * @return Pointer to the stored value, or nullptr if absent
     */
    const T* find(const Key& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    T* find(const Key& key) {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    /**
     * @throws std::out_of_range if the key is absent
     */
    const T& at(const Key& key) const {
        const T* found = find(key);
        if (!found) {
            throw std::out_of_range("OrderedMap::at: key not found");
        }
        return *found;
    }

    /**
     * @brief Position of @p key in insertion order, or size() if absent
     */
    std::size_t position(const Key& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? entries_.size() : it->second;
    }

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    friend bool operator==(const OrderedMap& a, const OrderedMap& b) {
        return a.entries_ == b.entries_;
    }

    friend bool operator!=(const OrderedMap& a, const OrderedMap& b) {
        return !(a == b);
    }

private:
    std::vector<value_type> entries_;
    std::unordered_map<Key, std::size_t> index_;
};

} // namespace allof

#endif // ALLOF_ORDEREDMAP_HPP
