// Copyright (C) 2024 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef OMAP_RANGES_HPP_
#define OMAP_RANGES_HPP_

#include "reduce.hpp"

#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace omap::ranges {
template <typename, typename = std::void_t<>>
struct is_stl_container : std::false_type {};

template <typename T>
struct is_stl_container<T, std::void_t<typename T::iterator>> : std::true_type {};

template <typename T>
constexpr bool is_stl_container_v = is_stl_container<T>::value;

template <typename, typename = std::void_t<>>
struct is_keyed : std::false_type {};

template <typename T>
struct is_keyed<T, std::void_t<typename T::key_type, typename T::mapped_type>> : std::true_type {};

template <typename T>
constexpr bool is_keyed_v = is_keyed<T>::value;

template <typename, typename = std::void_t<>>
struct has_reduce : std::false_type {};

template <typename T>
struct has_reduce<T, std::void_t<decltype(std::declval<const T&>().reduce(
    std::declval<command<int>>(),
    std::declval<command<int>(*)(const typename T::value_type&, int)>()))>> : std::true_type {};

template <typename T>
constexpr bool has_reduce_v = has_reduce<T>::value;

template <typename, typename = std::void_t<>>
struct has_size : std::false_type {};

template <typename T>
struct has_size<T, std::void_t<decltype(std::declval<const T&>().size())>> : std::true_type {};

template <typename, typename, typename = std::void_t<>>
struct has_contains : std::false_type {};

template <typename T, typename Key>
struct has_contains<T, Key, std::void_t<decltype(std::declval<const T&>().contains(std::declval<const Key&>()))>> : std::true_type {};

// keyed containers hand out assignable (key, value) pairs
template <typename Container, typename = void>
struct element {
    using type = typename Container::value_type;
};

template <typename Container>
struct element<Container, std::enable_if_t<is_keyed_v<Container>>> {
    using type = std::pair<typename Container::key_type, typename Container::mapped_type>;
};

template <typename Container>
using element_t = typename element<Container>::type;

template <typename Container>
using list_t = std::vector<element_t<Container>>;

// The container must outlive the result unless it supplies its own reduce.
template<typename Container, typename Acc, typename Func,
typename = std::enable_if_t<is_stl_container_v<Container>>>
auto reduce(const Container& container, command<Acc> cmd, Func func) -> reduction<Acc> {
    if constexpr (has_reduce_v<Container>)
        return container.reduce(std::move(cmd), std::move(func));
    else
        return reduce_from(nullptr, std::begin(container), std::end(container), std::move(cmd), std::move(func));
}

template<typename Container, typename T, typename Func,
typename = std::enable_if_t<is_stl_container_v<Container>>>
auto fold(const Container& container, T init, Func func) -> T {
    return ranges::reduce(container, cont(std::move(init)), [&func](const auto& item, T acc) {
        return cont(T(func(std::move(acc), item)));
    }).acc();
}

template<typename Container,
typename = std::enable_if_t<is_stl_container_v<Container>>>
auto to_list(const Container& container) {
    return ranges::reduce(container, cont(list_t<Container>{}), [](const auto& item, list_t<Container> acc) {
        acc.emplace_back(item);
        return cont(std::move(acc));
    }).acc();
}

template<typename Container,
typename = std::enable_if_t<is_stl_container_v<Container>>>
auto take(const Container& container, std::size_t count) {
    if(!count) return list_t<Container>{};
    return ranges::reduce(container, cont(list_t<Container>{}), [count](const auto& item, list_t<Container> acc) {
        acc.emplace_back(item);
        if(acc.size() < count)
            return cont(std::move(acc));
        return halt(std::move(acc));
    }).acc();
}

template<typename Container,
typename = std::enable_if_t<is_stl_container_v<Container>>>
auto drop(const Container& container, std::size_t count) {
    using state_t = std::pair<std::size_t, list_t<Container>>;
    return ranges::reduce(container, cont(state_t{}), [count](const auto& item, state_t acc) {
        if(acc.first < count)
            ++acc.first;
        else
            acc.second.emplace_back(item);
        return cont(std::move(acc));
    }).acc().second;
}

// Clamped to what exists: never pads, never fails.
template<typename Container,
typename = std::enable_if_t<is_stl_container_v<Container>>>
auto slice(const Container& container, std::size_t start, std::size_t length) {
    using state_t = std::pair<std::size_t, list_t<Container>>;
    if(!length) return list_t<Container>{};
    return ranges::reduce(container, cont(state_t{}), [start, length](const auto& item, state_t acc) {
        if(acc.first++ < start)
            return cont(std::move(acc));
        acc.second.emplace_back(item);
        if(acc.second.size() < length)
            return cont(std::move(acc));
        return halt(std::move(acc));
    }).acc().second;
}

template<typename Container, typename Pred,
typename = std::enable_if_t<is_stl_container_v<Container>>>
auto find_if(const Container& container, Pred pred) {
    using found_t = std::optional<element_t<Container>>;
    return ranges::reduce(container, cont(found_t{}), [&pred](const auto& item, found_t acc) {
        if(pred(item))
            return halt(found_t(item));
        return cont(std::move(acc));
    }).acc();
}

template<typename Container, typename Pred,
typename = std::enable_if_t<is_stl_container_v<Container>>>
auto any(const Container& container, Pred pred) {
    return ranges::find_if(container, std::move(pred)).has_value();
}

// Key membership for keyed containers, element search otherwise.
template<typename Container, typename T,
typename = std::enable_if_t<is_stl_container_v<Container>>>
auto member(const Container& container, const T& value) -> bool {
    if constexpr (has_contains<Container, T>::value)
        return container.contains(value);
    else if constexpr (is_keyed_v<Container>)
        return container.count(value) > 0;
    else
        return ranges::any(container, [&value](const auto& item) {return item == value;});
}

template<typename Container,
typename = std::enable_if_t<is_stl_container_v<Container>>>
auto count(const Container& container) -> std::size_t {
    if constexpr (has_size<Container>::value)
        return container.size();
    else
        return static_cast<std::size_t>(std::distance(std::begin(container), std::end(container)));
}

// Pulls one element at a time by suspending the traversal after each.
template<typename Container>
class cursor final {
public:
    using element_type = element_t<Container>;

    explicit cursor(const Container& container) :
    state_(ranges::reduce(container, suspend(std::optional<element_type>{}), [](const auto& item, std::optional<element_type>) {
        return suspend(std::optional<element_type>(item));
    })) {}

    auto next() -> std::optional<element_type> {
        if(!state_.is_suspended())
            return std::nullopt;
        state_ = state_.resume(cont(std::optional<element_type>{}));
        if(!state_.is_suspended())
            return std::nullopt;
        return state_.acc();
    }

private:
    reduction<std::optional<element_type>> state_;
};

template<typename Left, typename Right,
typename = std::enable_if_t<is_stl_container_v<Left> && is_stl_container_v<Right>>>
auto zip(const Left& left, const Right& right) {
    std::vector<std::pair<element_t<Left>, element_t<Right>>> result;
    cursor<Left> lhs(left);
    cursor<Right> rhs(right);
    for(;;) {
        auto a = lhs.next();
        auto b = rhs.next();
        if(!a || !b)
            break;
        result.emplace_back(std::move(*a), std::move(*b));
    }
    return result;
}

template<typename Map, typename Range>
auto into(const Range& range, const Map& map) -> Map {
    return map.into(std::begin(range), std::end(range));
}

template<typename Map, typename Range>
auto collect(const Range& range) -> Map {
    return ranges::into(range, Map());
}
} // end namespace
#endif
