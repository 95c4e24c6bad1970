/* Copyright (C) 2016 PuzzleFS */
#include "gear.h"

#include <cmath>

#include "common.h"

namespace puzzlefs
{

static const int GEAR_HASH_BITS = 32;

// splitmix64 - only used to fill the table deterministically
static inline uint64_t
_splitmix64(uint64_t* state)
{
    uint64_t z = (*state += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

Gear::Gear(uint64_t seed)
{
    uint64_t state = seed;
    for (int i = 0; i < 256; ++i) {
        _table[i] = Hash(_splitmix64(&state) >> 32);
    }
}

Gear::Hash
Gear::mask(int num_bits)
{
    REQUIRE(num_bits >= 0 && num_bits <= GEAR_HASH_BITS, DVAL(num_bits));
    Hash m = 0;
    for (int i = 0; i < num_bits; ++i) {
        // spread from the top bit down
        const int bit = GEAR_HASH_BITS - 1 - (i * GEAR_HASH_BITS) / num_bits;
        m |= Hash(1) << bit;
    }
    return m;
}

int
Gear::log2_round(uint64_t value)
{
    return int(std::lround(std::log2(double(value))));
}

} // namespace puzzlefs
