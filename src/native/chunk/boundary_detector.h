/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <memory>
#include <vector>

#include "../util/gear.h"
#include "../util/rabin.h"
#include "chunk_config.h"

namespace puzzlefs
{

/**
 * BoundaryDetector finds content defined chunk boundaries in a window of bytes.
 *
 * detect() appends to cuts the contiguous chunks found from the start of data,
 * with offsets relative to data. When is_final is false the last candidate is
 * withheld, since more bytes may extend it, unless it already reached max.
 * When is_final is true all the bytes are emitted, the last chunk may be
 * shorter than min, and an empty window yields no chunks.
 *
 * Detectors keep no state between calls. A boundary decision depends only on
 * the bytes since the previous cut, so chunking a stream in pieces yields the
 * same cuts as chunking it whole.
 */
class BoundaryDetector
{
public:
    struct Cut
    {
        int offset;
        int length;
    };
    typedef std::vector<Cut> Cuts;

    virtual ~BoundaryDetector() {}

    virtual void detect(
        const uint8_t* data,
        int len,
        int min_chunk,
        int avg_chunk,
        int max_chunk,
        bool is_final,
        Cuts& cuts) const = 0;

    virtual const char* name() const = 0;
};

/**
 * FastCDC - normalized chunking with a gear hash.
 * Below the center size a strict mask (more bits) is used,
 * and above it a loose mask (less bits), which narrows the chunk size distribution.
 */
class FastCdcDetector : public BoundaryDetector
{
public:
    virtual void detect(
        const uint8_t* data,
        int len,
        int min_chunk,
        int avg_chunk,
        int max_chunk,
        bool is_final,
        Cuts& cuts) const;

    virtual const char* name() const { return "fastcdc"; }

private:
    static Gear _gear;
};

/**
 * Rabin fingerprint chunking over a 64 byte sliding window.
 * A boundary is set when the low log2(avg) bits of the fingerprint are all ones.
 */
class RabinDetector : public BoundaryDetector
{
public:
    virtual void detect(
        const uint8_t* data,
        int len,
        int min_chunk,
        int avg_chunk,
        int max_chunk,
        bool is_final,
        Cuts& cuts) const;

    virtual const char* name() const { return "rabin"; }

private:
    static Rabin _rabin;
};

/**
 * returns a shared detector for the algorithm.
 * detectors are immutable so the same instance serves all chunkers and threads.
 */
std::shared_ptr<const BoundaryDetector> make_boundary_detector(ChunkConfig::Algorithm algorithm);

} // namespace puzzlefs
