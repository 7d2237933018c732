#pragma once

#include "tournament.hpp"

#include <string>

namespace arb {

/**
 * Binary document for a tournament. Little-endian fixed-width integers and
 * u64 length-prefixed strings and collections, prefixed by the magic "ARBT"
 * and a format version. deserializeTournament(serializeTournament(t)) == t.
 */
std::string serializeTournament(const Tournament& tournament);

// Throws std::invalid_argument on truncated, trailing or unknown data.
Tournament deserializeTournament(const std::string& document);

} // namespace arb
