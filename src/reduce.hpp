// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef OMAP_REDUCE_HPP_
#define OMAP_REDUCE_HPP_

#include <functional>
#include <type_traits>
#include <utility>

namespace omap {
enum class signal { cont, halt, suspend };

template<typename Acc>
struct command final {
    signal action{signal::cont};
    Acc acc{};
};

template<typename Acc>
auto cont(Acc acc) {
    return command<Acc>{signal::cont, std::move(acc)};
}

template<typename Acc>
auto halt(Acc acc) {
    return command<Acc>{signal::halt, std::move(acc)};
}

template<typename Acc>
auto suspend(Acc acc) {
    return command<Acc>{signal::suspend, std::move(acc)};
}

// Outcome of a traversal. A suspended reduction carries the continuation
// that picks up at the next unvisited element.
template<typename Acc>
class reduction final {
public:
    enum class state { done, halted, suspended };
    using continuation_t = std::function<reduction(command<Acc>)>;

    static auto done(Acc acc) {
        return reduction(state::done, std::move(acc), nullptr);
    }

    static auto halted(Acc acc) {
        return reduction(state::halted, std::move(acc), nullptr);
    }

    static auto suspended(Acc acc, continuation_t next) {
        return reduction(state::suspended, std::move(acc), std::move(next));
    }

    operator bool() const {
        return state_ == state::done;
    }

    auto operator!() const {
        return state_ != state::done;
    }

    auto status() const {
        return state_;
    }

    auto is_done() const {
        return state_ == state::done;
    }

    auto is_halted() const {
        return state_ == state::halted;
    }

    auto is_suspended() const {
        return state_ == state::suspended;
    }

    auto acc() const -> const Acc& {
        return acc_;
    }

    auto resume(command<Acc> cmd) const -> reduction {
        if(state_ != state::suspended || !next_)
            return *this;
        return next_(std::move(cmd));
    }

    auto resume() const -> reduction {
        return resume(cont(acc_));
    }

private:
    reduction(state status, Acc acc, continuation_t next) : state_(status), acc_(std::move(acc)), next_(std::move(next)) {}

    state state_{state::done};
    Acc acc_;
    continuation_t next_;
};

// Folds [from, to) driven by the commands func returns. Owner is held by
// any continuation so the iterators it captures stay valid; pass nullptr
// when the caller guarantees the range outlives the reduction.
template<typename Owner, typename Iter, typename Acc, typename Func>
auto reduce_from(Owner owner, Iter from, Iter to, command<Acc> cmd, Func func) -> reduction<Acc> {
    static_assert(std::is_move_assignable_v<Acc>, "Acc must be move assignable");
    auto action = cmd.action;
    auto acc = std::move(cmd.acc);
    for(;;) {
        if(action == signal::halt)
            return reduction<Acc>::halted(std::move(acc));

        if(action == signal::suspend) {
            return reduction<Acc>::suspended(std::move(acc), [owner, from, to, func](command<Acc> next) {
                return reduce_from(owner, from, to, std::move(next), func);
            });
        }

        if(from == to)
            return reduction<Acc>::done(std::move(acc));

        command<Acc> step = func(*from, std::move(acc));
        ++from;
        action = step.action;
        acc = std::move(step.acc);
    }
}
} // end namespace
#endif
