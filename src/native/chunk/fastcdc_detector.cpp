/* Copyright (C) 2016 PuzzleFS */
#include "boundary_detector.h"

namespace puzzlefs
{

// fixed for all processes, changing it changes every chunk boundary
#define PFS_GEAR_SEED 0x50555a5a4c454653ULL

Gear FastCdcDetector::_gear(PFS_GEAR_SEED);

struct FastCdcMasks
{
    Gear::Hash strict;
    Gear::Hash loose;
};

// the size up to which the strict mask is used
static inline int
_center_size(int avg_chunk, int min_chunk, int size)
{
    int offset = min_chunk + (min_chunk + 1) / 2;
    if (offset > avg_chunk) {
        offset = avg_chunk;
    }
    const int center = avg_chunk - offset;
    return center > size ? size : center;
}

static int
_next_cut(
    const Gear& gear,
    const FastCdcMasks& masks,
    const uint8_t* data,
    int len,
    int min_chunk,
    int avg_chunk,
    int max_chunk,
    bool is_final)
{
    // a window of max_chunk bytes is always cut, also when min_chunk == max_chunk
    if (len <= min_chunk && len < max_chunk) {
        return is_final ? len : 0;
    }

    const int size = len > max_chunk ? max_chunk : len;
    const int center = _center_size(avg_chunk, min_chunk, size);
    Gear::Hash hash = 0;
    int pos = min_chunk;

    for (; pos < center; ++pos) {
        hash = gear.update(hash, data[pos]);
        if (!(hash & masks.strict)) {
            return pos;
        }
    }
    for (; pos < size; ++pos) {
        hash = gear.update(hash, data[pos]);
        if (!(hash & masks.loose)) {
            return pos;
        }
    }

    // without a match a longer chunk might still be found in the next bytes,
    // unless we already hold max_chunk bytes.
    if (!is_final && size < max_chunk) {
        return 0;
    }
    return size;
}

void
FastCdcDetector::detect(
    const uint8_t* data,
    int len,
    int min_chunk,
    int avg_chunk,
    int max_chunk,
    bool is_final,
    Cuts& cuts) const
{
    const int bits = Gear::log2_round(avg_chunk);
    FastCdcMasks masks;
    masks.strict = Gear::mask(bits + 1);
    masks.loose = Gear::mask(bits - 1);

    int pos = 0;
    while (pos < len) {
        const int n = _next_cut(
            _gear, masks, data + pos, len - pos, min_chunk, avg_chunk, max_chunk, is_final);
        if (!n) break;
        Cut c;
        c.offset = pos;
        c.length = n;
        cuts.push_back(c);
        pos += n;
    }
}

} // namespace puzzlefs
