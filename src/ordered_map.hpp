// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef OMAP_ORDERED_MAP_HPP_
#define OMAP_ORDERED_MAP_HPP_

#include "print.hpp"
#include "reduce.hpp"

#include <unordered_map>
#include <vector>
#include <memory>
#include <optional>
#include <variant>
#include <initializer_list>
#include <iterator>
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace omap {
class key_conflict final : public std::runtime_error {
public:
    key_conflict(const std::string& key, const std::string& contents) :
    std::runtime_error(omap::format("key {} already exists in: {}", key, contents)), key_(key), contents_(contents) {}

    auto key() const noexcept -> const std::string& {
        return key_;
    }

    auto contents() const noexcept -> const std::string& {
        return contents_;
    }

private:
    std::string key_;
    std::string contents_;
};

// Returned from a get_and_update function to drop the key instead.
struct pop_t final {
    explicit constexpr pop_t() = default;
};

inline constexpr pop_t pop_entry{};

template<typename R, typename V>
using update_t = std::variant<std::pair<R, V>, pop_t>;

// Insertion ordered persistent map. Keys live in a shared singly linked
// list, newest first, next to a copy-on-write lookup table. Every
// modifier returns a new map and leaves this one untouched.
template<typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
class ordered_map final {
    struct node_t;
    using link_t = std::shared_ptr<const node_t>;
    using table_t = std::unordered_map<K, V, Hash, KeyEqual>;

    struct node_t final {
        K key;
        link_t next;
        node_t(const K& from, link_t link) : key(from), next(std::move(link)) {}
        node_t(const node_t&) = delete;
        auto operator=(const node_t&) -> auto& = delete;

        ~node_t() {
            release(next);
        }
    };

public:
    using key_type = K;
    using mapped_type = V;
    using value_type = typename table_t::value_type;
    using element_type = std::pair<K, V>;
    using size_type = std::size_t;
    using const_reference = const value_type&;

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<const K, V>;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        const_iterator() = default;

        auto operator*() const -> reference {
            return *(*order_)[pos_];
        }

        auto operator->() const -> pointer {
            return (*order_)[pos_];
        }

        auto operator++() -> const_iterator& {
            ++pos_;
            return *this;
        }

        auto operator++(int) -> const_iterator {
            auto prior = *this;
            ++pos_;
            return prior;
        }

        auto operator==(const const_iterator& other) const {
            return pos_ == other.pos_;
        }

        auto operator!=(const const_iterator& other) const {
            return pos_ != other.pos_;
        }

    private:
        friend class ordered_map;
        using order_t = std::vector<pointer>;

        const_iterator(std::shared_ptr<const order_t> order, size_type pos) : order_(std::move(order)), pos_(pos) {}

        std::shared_ptr<const order_t> order_;
        size_type pos_{0};
    };

    using iterator = const_iterator;

    ordered_map() : map_(empty_table()) {}
    ordered_map(const std::initializer_list<element_type>& list) : ordered_map(list.begin(), list.end()) {}

    template<typename Iter, typename = typename std::iterator_traits<Iter>::iterator_category>
    ordered_map(Iter first, Iter last) : ordered_map(ordered_map().into(first, last)) {}

    ordered_map(const ordered_map&) = default;

    // moved-from maps are left empty
    ordered_map(ordered_map&& other) noexcept : map_(empty_table()) {
        swap(other);
    }

    ~ordered_map() {
        release(keys_);
    }

    auto operator=(ordered_map other) noexcept -> ordered_map& {
        swap(other);
        return *this;
    }

    void swap(ordered_map& other) noexcept {
        keys_.swap(other.keys_);
        map_.swap(other.map_);
        std::swap(size_, other.size_);
    }

    friend void swap(ordered_map& lhs, ordered_map& rhs) noexcept {
        lhs.swap(rhs);
    }

    explicit operator bool() const {
        return size_ > 0;
    }

    auto operator!() const {
        return size_ == 0;
    }

    auto operator[](const K& key) const -> std::optional<V> {
        return fetch(key);
    }

    auto operator==(const ordered_map& other) const {
        if(size_ != other.size_)
            return false;

        const auto& equal = map_->key_eq();
        auto lhs = keys_.get();
        auto rhs = other.keys_.get();
        while(lhs != nullptr && lhs != rhs) {
            if(!equal(lhs->key, rhs->key))
                return false;
            lhs = lhs->next.get();
            rhs = rhs->next.get();
        }
        return map_ == other.map_ || *map_ == *other.map_;
    }

    auto operator!=(const ordered_map& other) const {
        return !(*this == other);
    }

    auto size() const {
        return size_;
    }

    auto count() const {
        return size_;
    }

    auto empty() const {
        return size_ == 0;
    }

    auto contains(const K& key) const {
        return map_->find(key) != map_->end();
    }

    auto find(const K& key) const -> const V* {
        auto it = map_->find(key);
        if(it == map_->end())
            return nullptr;
        return &it->second;
    }

    auto fetch(const K& key) const -> std::optional<V> {
        auto it = map_->find(key);
        if(it == map_->end())
            return std::nullopt;
        return it->second;
    }

    auto get(const K& key, const V& alt) const -> V {
        auto it = map_->find(key);
        if(it == map_->end())
            return alt;
        return it->second;
    }

    auto put(const K& key, const V& value) const {
        auto table = std::make_shared<table_t>(*map_);
        if(table->insert_or_assign(key, value).second)
            return ordered_map(std::make_shared<const node_t>(key, keys_), std::move(table), size_ + 1);
        return ordered_map(keys_, std::move(table), size_);
    }

    auto put_if_absent(const K& key, const V& value) const {
        if(contains(key))
            return *this;
        return put(key, value);
    }

    auto put_if_absent_or_fail(const K& key, const V& value) const {
        if(contains(key))
            throw key_conflict(omap::inspect(key), to_string());
        return put(key, value);
    }

    auto remove(const K& key) const {
        if(!contains(key))
            return *this;

        auto table = std::make_shared<table_t>(*map_);
        table->erase(key);
        return ordered_map(unlink(key), std::move(table), size_ - 1);
    }

    auto pop(const K& key) const -> std::pair<std::optional<V>, ordered_map> {
        auto value = fetch(key);
        if(!value)
            return {std::nullopt, *this};
        return {std::move(value), remove(key)};
    }

    // Func takes the current value (empty when absent) and returns an
    // update_t: a (result, new value) pair to store, or pop_entry to drop
    // the key and hand back its former value.
    template<typename Func>
    auto get_and_update(const K& key, Func func) const {
        using update = std::invoke_result_t<Func, std::optional<V>>;
        using result_type = typename std::variant_alternative_t<0, update>::first_type;
        static_assert(std::is_same_v<update, update_t<result_type, V>>, "Func must return update_t<R, V>");
        static_assert(std::is_constructible_v<result_type, std::optional<V>>, "R must accept the popped value");

        auto change = func(fetch(key));
        if(std::holds_alternative<pop_t>(change)) {
            auto [value, rest] = pop(key);
            return std::pair<result_type, ordered_map>(result_type(std::move(value)), std::move(rest));
        }

        auto& [result, value] = std::get<0>(change);
        return std::pair<result_type, ordered_map>(std::move(result), put(key, value));
    }

    template<typename Iter>
    auto into(Iter first, Iter last) const -> ordered_map {
        auto table = std::make_shared<table_t>(*map_);
        auto keys = keys_;
        auto count = size_;
        while(first != last) {
            const auto& [key, value] = *first++;
            if(table->insert_or_assign(key, value).second) {
                keys = std::make_shared<const node_t>(key, std::move(keys));
                ++count;
            }
        }
        return ordered_map(std::move(keys), std::move(table), count);
    }

    template<typename Range>
    auto into(const Range& range) const {
        return into(std::begin(range), std::end(range));
    }

    auto keys() const {
        std::vector<K> list;
        list.reserve(size_);
        for(auto link = keys_.get(); link != nullptr; link = link->next.get())
            list.push_back(link->key);
        std::reverse(list.begin(), list.end());
        return list;
    }

    auto values() const {
        std::vector<V> list;
        list.reserve(size_);
        for(const auto& [key, value] : *this)
            list.push_back(value);
        return list;
    }

    auto entries() const {
        return slice(0, size_);
    }

    auto slice(size_type start, size_type length) const -> std::vector<element_type> {
        std::vector<element_type> list;
        if(start >= size_ || !length)
            return list;

        auto count = std::min(length, size_ - start);
        list.reserve(count);
        auto order = ordering();
        for(auto pos = start; pos < start + count; ++pos)
            list.emplace_back((*order)[pos]->first, (*order)[pos]->second);
        return list;
    }

    template<typename Acc, typename Func>
    auto reduce(command<Acc> cmd, Func func) const -> reduction<Acc> {
        return reduce_from(*this, begin(), end(), std::move(cmd), std::move(func));
    }

    auto begin() const -> const_iterator {
        return const_iterator(ordering(), 0);
    }

    auto end() const -> const_iterator {
        return const_iterator(nullptr, size_);
    }

    auto to_string() const {
        std::string text = "ordered_map{";
        auto sep = "";
        for(const auto& [key, value] : *this) {
            text += omap::format("{}{}: {}", sep, omap::inspect(key), omap::inspect(value));
            sep = ", ";
        }
        return text + "}";
    }

private:
    using order_t = typename const_iterator::order_t;

    link_t keys_;
    std::shared_ptr<const table_t> map_;
    size_type size_{0};

    ordered_map(link_t keys, std::shared_ptr<const table_t> map, size_type size) : keys_(std::move(keys)), map_(std::move(map)), size_(size) {}

    static auto empty_table() noexcept -> std::shared_ptr<const table_t> {
        static const auto empty = std::make_shared<const table_t>();
        return empty;
    }

    // unwind nodes held only by this link without recursing through next
    static void release(link_t& link) noexcept {
        while(link && link.use_count() == 1) {
            auto next = link->next;
            link = std::move(next);
        }
        link.reset();
    }

    auto ordering() const -> std::shared_ptr<const order_t> {
        auto order = std::make_shared<order_t>(size_, nullptr);
        auto pos = size_;
        for(auto link = keys_.get(); link != nullptr; link = link->next.get())
            (*order)[--pos] = &*map_->find(link->key);
        return order;
    }

    // rebuild the nodes in front of key and share everything behind it
    auto unlink(const K& key) const -> link_t {
        const auto& equal = map_->key_eq();
        std::vector<const node_t *> prefix;
        auto link = keys_.get();
        while(link != nullptr && !equal(link->key, key)) {
            prefix.push_back(link);
            link = link->next.get();
        }

        if(link == nullptr)
            return keys_;

        auto tail = link->next;
        for(auto it = prefix.rbegin(); it != prefix.rend(); ++it)
            tail = std::make_shared<const node_t>((*it)->key, std::move(tail));
        return tail;
    }
};
} // end namespace
#endif
