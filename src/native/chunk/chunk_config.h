/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <string>

#include "../util/common.h"

namespace puzzlefs
{

// debug level shared by all the chunk modules (DBG_INIT_VAR)
extern int chunk_debug_level;
void set_chunk_debug_level(int level);

class ChunkConfigError : public Exception
{
public:
    explicit ChunkConfigError(std::string msg)
        : Exception(std::string("ChunkConfigError: ") + msg) {}
};

/**
 * ChunkConfig holds the chunk size bounds of a chunking profile.
 * The streaming window is max_chunk bytes, so it always holds enough bytes
 * to resolve at least one boundary when full.
 */
struct ChunkConfig
{
    enum Algorithm {
        FASTCDC,
        RABIN,
    };

    int min_chunk;
    int avg_chunk;
    int max_chunk;
    Algorithm algorithm;

    ChunkConfig(int min, int avg, int max, Algorithm algo = FASTCDC)
        : min_chunk(min)
        , avg_chunk(avg)
        , max_chunk(max)
        , algorithm(algo)
    {
    }

    // profile for image builds - large chunks shared between base image files
    static ChunkConfig image_profile();

    // profile used to compare against the whole buffer reference chunking
    static ChunkConfig conformance_profile();

    /**
     * throws ChunkConfigError unless 0 < min <= avg <= max
     * and the sizes are in the ranges accepted by the algorithm.
     */
    void validate() const;

    static Algorithm parse_algorithm(const std::string& name);
    static const char* algorithm_name(Algorithm algo);
};

std::ostream& operator<<(std::ostream& os, const ChunkConfig& config);

} // namespace puzzlefs
