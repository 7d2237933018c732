#include "randomness_resolver.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: replay_shuffle <randomSeed> <item> [item...]\n";
        return 1;
    }

    std::uint32_t seed = 0;
    try {
        const auto value = std::stoull(argv[1]);
        if (value > 0xFFFFFFFFULL) {
            throw std::out_of_range("seed exceeds 32 bits");
        }
        seed = static_cast<std::uint32_t>(value);
    } catch (const std::exception& ex) {
        std::cerr << "Random seed must be an unsigned 32-bit integer: " << ex.what() << '\n';
        return 1;
    }

    std::vector<std::string> items(argv + 2, argv + argc);
    const auto shuffled = arb::resolveShuffle(items, seed);
    for (std::size_t i = 0; i < shuffled.size(); ++i) {
        std::cout << i << ' ' << shuffled[i] << '\n';
    }
    return 0;
}
