/* Copyright (C) 2016 PuzzleFS */
#include "buf.h"

namespace puzzlefs
{

static const char HEX_CHARS[] = {
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
};

std::string
Buf::hex() const
{
    std::string str;
    str.resize(2 * _len);
    for (int i = 0, j = 0; i < _len; ++i, j += 2) {
        str[j] = HEX_CHARS[_data[i] >> 4];
        str[j + 1] = HEX_CHARS[_data[i] & 0xf];
    }
    return str;
}

} // namespace puzzlefs
