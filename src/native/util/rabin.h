/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <stdint.h>

namespace puzzlefs
{

/**
 * Rabin fingerprint over a sliding window of window_len bytes,
 * computed in GF(2) modulo an irreducible polynomial of the given degree.
 */
class Rabin
{
public:
    typedef uint64_t Hash;

    Rabin(Hash poly, int degree, int window_len);

    inline Hash
    update(Hash hash, uint8_t byte_in, uint8_t byte_out) const
    {
        // shift one byte left, the carried byte is reduced (mod p) with a table
        return ((hash << 8) & _mask)
            ^ _shift_byte_table[hash >> _carry_byte_shift]
            // byte_out was shifted window_len bytes since it entered, so remove
            // byte_out << window_len*8 (mod p)
            ^ _window_shift_table[byte_out]
            ^ byte_in;
    }

    int degree() const { return _degree; }
    int window_len() const { return _window_len; }

private:
    const Hash _poly;
    const int _degree;
    const int _window_len;
    const Hash _mask;
    const int _carry_bit_shift;
    const int _carry_byte_shift;
    Hash _shift_byte_table[256];
    Hash _window_shift_table[256];

    Hash _shift_bit_left(Hash a) const;
    Hash _shift_bits_left(Hash a, int n) const;
    Hash _mult(Hash a, Hash b) const;
};

} // namespace puzzlefs
