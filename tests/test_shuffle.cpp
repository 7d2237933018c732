#include "randomness_resolver.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "shuffle_test failure: " << msg << std::endl;
    std::exit(1);
}

} // namespace

int main() {
    using namespace arb;

    const std::vector<std::string> field{"alpha", "bravo", "charlie", "delta",
                                         "echo",  "foxtrot", "golf", "hotel"};
    const std::vector<std::uint32_t> seeds{0, 1, 42, 1103515245, 0x7FFFFFFF, 0xFFFFFFFF};

    bool anyMoved = false;
    for (auto seed : seeds) {
        const auto first = resolveShuffle(field, seed);
        const auto second = resolveShuffle(field, seed);
        if (first != second) {
            fail("same seed produced different permutations for seed " + std::to_string(seed));
        }
        auto sortedOut = first;
        auto sortedIn = field;
        std::sort(sortedOut.begin(), sortedOut.end());
        std::sort(sortedIn.begin(), sortedIn.end());
        if (sortedOut != sortedIn) {
            fail("shuffle is not a permutation for seed " + std::to_string(seed));
        }
        anyMoved = anyMoved || first != field;
    }
    if (!anyMoved) {
        fail("no seed moved any element");
    }

    // Hand-computed: state 0 -> 12345, 12345 % 2 = 1, so the pair stays.
    // With seed 1: state 1103527590 is even, so the pair is swapped.
    const std::vector<std::string> pair{"a", "b"};
    if (resolveShuffle(pair, 0) != pair) {
        fail("seed 0 should keep a two-element list in place");
    }
    if (resolveShuffle(pair, 1) != std::vector<std::string>{"b", "a"}) {
        fail("seed 1 should swap a two-element list");
    }

    // Published seeds must replay to the same order on any auditor build.
    const std::vector<std::string> pinned{"charlie", "echo",    "golf",  "hotel",
                                          "bravo",   "foxtrot", "alpha", "delta"};
    if (resolveShuffle(field, 42) != pinned) {
        fail("seed 42 no longer replays to the pinned order");
    }

    if (!resolveShuffle(std::vector<std::string>{}, 7).empty()) {
        fail("empty input should stay empty");
    }
    if (resolveShuffle(std::vector<int>{5}, 9) != std::vector<int>{5}) {
        fail("single element should stay put");
    }

    std::cout << "shuffle_test: ok\n";
    return 0;
}
