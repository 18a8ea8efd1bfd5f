// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#undef  NDEBUG
#include "compiler.hpp"     // IWYU pragma: keep
#include "ordered_map.hpp"
#include "ranges.hpp"

#include <map>
#include <string>
#include <vector>
#include <cstdlib>

namespace {
using int_map = ordered_map<std::string, int>;
using entry = std::pair<std::string, int>;
using entries = std::vector<entry>;
} // end namespace

auto main([[maybe_unused]] int argc, [[maybe_unused]] char **argv) -> int {
    try {
        using namespace omap::ranges;
        const int_map pairs{{"k1", 1}, {"k2", 2}, {"k3", 3}};
        const int_map empty;

        assert(to_list(pairs) == entries({{"k1", 1}, {"k2", 2}, {"k3", 3}}));
        assert(take(empty, 1).empty());
        assert(take(pairs, 0).empty());
        assert(take(pairs, 2) == entries({{"k1", 1}, {"k2", 2}}));
        assert(take(pairs, 10).size() == 3);
        assert(drop(pairs, 1) == entries({{"k2", 2}, {"k3", 3}}));
        assert(drop(pairs, 5).empty());

        // slice runs past the end without padding
        assert(slice(pairs, 1, 3) == entries({{"k2", 2}, {"k3", 3}}));
        assert(slice(pairs, 1, 3) == pairs.slice(1, 3));
        assert(slice(pairs, 3, 2).empty());
        assert(slice(pairs, 0, 1) == entries({{"k1", 1}}));

        auto total = fold(pairs, 0, [](int acc, const auto& item) {
            return acc + item.second;
        });
        assert(total == 6);

        auto found = find_if(pairs, [](const auto& item) {return item.second > 1;});
        assert(found.has_value());
        assert(found->first == "k2");
        assert(!find_if(empty, [](const auto&) {return true;}));
        assert(any(pairs, [](const auto& item) {return item.first == "k3";}));

        assert(member(pairs, std::string("k2")));
        assert(!member(pairs, std::string("k9")));
        assert(count(pairs) == 3);
        assert(count(empty) == 0);

        // pull elements lazily through suspended traversal
        cursor<int_map> walk(pairs);
        assert(walk.next()->first == "k1");
        assert(walk.next()->first == "k2");
        assert(walk.next()->first == "k3");
        assert(!walk.next());
        assert(!walk.next());

        const std::vector<int> numbers{10, 20};
        auto zipped = zip(pairs, numbers);
        assert(zipped.size() == 2);
        assert(zipped[0].first == entry("k1", 1));
        assert(zipped[1].second == 20);

        // collect pairs, later duplicates update in place
        const entries source{{"b", 2}, {"a", 1}, {"b", 20}};
        auto built = collect<int_map>(source);
        assert(built.keys() == std::vector<std::string>({"b", "a"}));
        assert(built.get("b", 0) == 20);
        auto grown = into(entries{{"c", 3}}, built);
        assert(grown.keys() == std::vector<std::string>({"b", "a", "c"}));
        assert(built.size() == 2);

        // plain stl containers go through the same protocol
        assert(take(numbers, 1) == std::vector<int>({10}));
        assert(member(numbers, 20));
        assert(!member(numbers, 30));
        assert(fold(numbers, 0, [](int acc, int item) {return acc + item;}) == 30);
        const std::map<std::string, int> sorted{{"x", 1}};
        assert(member(sorted, std::string("x")));
        assert(to_list(sorted) == entries({{"x", 1}}));
    }
    catch(...) {
        ::exit(-1);
    }
}
