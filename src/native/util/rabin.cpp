/* Copyright (C) 2016 PuzzleFS */
#include "rabin.h"

#include "common.h"

namespace puzzlefs
{

Rabin::Rabin(Hash poly, int degree, int window_len)
    : _poly(poly)
    , _degree(degree)
    , _window_len(window_len)
    , _mask(~(((~(Hash)0) >> degree) << degree))
    , _carry_bit_shift(degree - 1)
    , _carry_byte_shift(degree - 8)
{
    REQUIRE(_carry_byte_shift > 0, DVAL(degree));
    REQUIRE(_degree < (int)sizeof(Hash) * 8, DVAL(degree));
    REQUIRE((_poly & _mask) == _poly, DVAL(poly) << DVAL(degree));

    for (int i = 0; i < 256; ++i) {
        // the value a carried byte adds back: byte << carry_byte_shift (mod p)
        _shift_byte_table[i] = _shift_bits_left(i, 8 * _carry_byte_shift);
        // the value of a byte once it falls off the window: byte << window (mod p)
        _window_shift_table[i] = _shift_bits_left(i, 8 * _window_len);
    }

    // necessary (not sufficient) irreducibility check: 2^(2^degree) = 2 (mod p)
    const Hash TWO = 2;
    Hash a = TWO;
    for (int i = 0; i < _degree; ++i) {
        a = _mult(a, a);
    }
    REQUIRE(a == TWO, "reducible polynomial " << DVAL(poly) << DVAL(degree));
}

Rabin::Hash
Rabin::_shift_bit_left(Hash a) const
{
    if (a >> _carry_bit_shift) {
        return ((a << 1) & _mask) ^ _poly;
    } else {
        return a << 1;
    }
}

Rabin::Hash
Rabin::_shift_bits_left(Hash a, int n) const
{
    while (n-- > 0) {
        a = _shift_bit_left(a);
    }
    return a;
}

Rabin::Hash
Rabin::_mult(Hash a, Hash b) const
{
    Hash result = 0;
    while (a && b) {
        // b(x) has the +1 term, add a(x)
        if (b & 1) result ^= a;
        // b = b/x, a = a*x (mod p)
        b >>= 1;
        a = _shift_bit_left(a);
    }
    return result;
}

} // namespace puzzlefs
