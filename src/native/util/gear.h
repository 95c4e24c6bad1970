/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <stdint.h>

namespace puzzlefs
{

/**
 * Gear rolling hash as used by FastCDC.
 *
 * Every update shifts the hash right by one bit and adds a random 32 bit
 * value per input byte, so a byte stops affecting the hash after 32 updates
 * and no explicit window needs to be kept.
 * The table is generated from a fixed seed so every instance and every
 * process produces the same hash for the same bytes.
 */
class Gear
{
public:
    typedef uint32_t Hash;

    explicit Gear(uint64_t seed);

    inline Hash
    update(Hash hash, uint8_t byte_in) const
    {
        return (hash >> 1) + _table[byte_in];
    }

    /**
     * returns a mask with num_bits set bits, spread evenly over the hash width.
     * a hash matches when (hash & mask) == 0, so on random input
     * a match happens once every 2^num_bits bytes.
     */
    static Hash mask(int num_bits);

    /**
     * log2 of value rounded to the nearest integer.
     */
    static int log2_round(uint64_t value);

private:
    Hash _table[256];
};

} // namespace puzzlefs
