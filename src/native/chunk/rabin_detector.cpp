/* Copyright (C) 2016 PuzzleFS */
#include "boundary_detector.h"

namespace puzzlefs
{

// See https://web.eecs.utk.edu/~plank/plank/papers/CS-07-593/primitive-polynomial-table.txt
#define PFS_RABIN_POLY 011
#define PFS_RABIN_DEGREE 31
#define PFS_RABIN_WINDOW_LEN 64

// the rabin tables are shared by all chunkers,
// the properties are set on compile time since they define the chunk boundaries
Rabin RabinDetector::_rabin(PFS_RABIN_POLY, PFS_RABIN_DEGREE, PFS_RABIN_WINDOW_LEN);

static int
_next_cut(
    const Rabin& rabin,
    const Rabin::Hash avg_chunk_mask,
    const uint8_t* data,
    int len,
    int min_chunk,
    int max_chunk,
    bool is_final)
{
    if (len <= 0) {
        return 0;
    }

    uint8_t window[PFS_RABIN_WINDOW_LEN];
    memset(window, 0, sizeof(window));
    int window_pos = 0;
    Rabin::Hash hash = 0;

    const int size = len < max_chunk ? len : max_chunk;
    // skip byte scanning as long as below min chunk length
    int pos = min_chunk < size ? min_chunk : size;

    while (pos < size) {
        const uint8_t byte = data[pos];
        pos++;
        hash = rabin.update(hash, byte, window[window_pos]);
        if ((hash & avg_chunk_mask) == avg_chunk_mask) {
            return pos;
        }
        window[window_pos] = byte;
        window_pos++;
        if (window_pos >= PFS_RABIN_WINDOW_LEN) {
            window_pos = 0;
        }
    }

    if (size >= max_chunk || is_final) {
        return size;
    }
    return 0;
}

void
RabinDetector::detect(
    const uint8_t* data,
    int len,
    int min_chunk,
    int avg_chunk,
    int max_chunk,
    bool is_final,
    Cuts& cuts) const
{
    const int avg_chunk_bits = Gear::log2_round(avg_chunk);
    ASSERT(avg_chunk_bits < _rabin.degree(), DVAL(avg_chunk_bits) << DVAL(_rabin.degree()));
    const Rabin::Hash avg_chunk_mask = ~(~((Rabin::Hash)0) << avg_chunk_bits);

    int pos = 0;
    while (pos < len) {
        const int n = _next_cut(
            _rabin, avg_chunk_mask, data + pos, len - pos, min_chunk, max_chunk, is_final);
        if (!n) break;
        Cut c;
        c.offset = pos;
        c.length = n;
        cuts.push_back(c);
        pos += n;
    }
}

} // namespace puzzlefs
