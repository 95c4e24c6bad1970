/* Copyright (C) 2016 PuzzleFS */
#include "chunk_config.h"

namespace puzzlefs
{

int chunk_debug_level = 0;

void
set_chunk_debug_level(int level)
{
    chunk_debug_level = level;
}

// image chunks are large: base images are ~40MB, and we want to share them
static const int IMAGE_MIN_CHUNK = 10 * 1024 * 1024;
static const int IMAGE_AVG_CHUNK = 40 * 1024 * 1024;
static const int IMAGE_MAX_CHUNK = 256 * 1024 * 1024;

// the accepted ranges of the FastCDC reference chunker
static const int FASTCDC_MIN_CHUNK_LOW = 64;
static const int FASTCDC_MIN_CHUNK_HIGH = 64 * 1024 * 1024;
static const int FASTCDC_AVG_CHUNK_LOW = 256;
static const int FASTCDC_AVG_CHUNK_HIGH = 256 * 1024 * 1024;
static const int FASTCDC_MAX_CHUNK_LOW = 1024;
static const int FASTCDC_MAX_CHUNK_HIGH = 1024 * 1024 * 1024;

ChunkConfig
ChunkConfig::image_profile()
{
    return ChunkConfig(IMAGE_MIN_CHUNK, IMAGE_AVG_CHUNK, IMAGE_MAX_CHUNK);
}

ChunkConfig
ChunkConfig::conformance_profile()
{
    return ChunkConfig(8192, 16384, 32768);
}

static void
_check_range(const char* name, int val, int low, int high)
{
    if (val < low || val > high) {
        throw ChunkConfigError(XSTR()
            << name << "=" << val << " out of range [" << low << ", " << high << "]");
    }
}

void
ChunkConfig::validate() const
{
    if (min_chunk <= 0) {
        throw ChunkConfigError(XSTR() << DVAL(min_chunk) << "should be positive");
    }
    if (min_chunk > avg_chunk) {
        throw ChunkConfigError(XSTR() << DVAL(min_chunk) << "should not exceed " << DVAL(avg_chunk));
    }
    if (avg_chunk > max_chunk) {
        throw ChunkConfigError(XSTR() << DVAL(avg_chunk) << "should not exceed " << DVAL(max_chunk));
    }
    switch (algorithm) {
    case FASTCDC:
        _check_range("min_chunk", min_chunk, FASTCDC_MIN_CHUNK_LOW, FASTCDC_MIN_CHUNK_HIGH);
        _check_range("avg_chunk", avg_chunk, FASTCDC_AVG_CHUNK_LOW, FASTCDC_AVG_CHUNK_HIGH);
        _check_range("max_chunk", max_chunk, FASTCDC_MAX_CHUNK_LOW, FASTCDC_MAX_CHUNK_HIGH);
        break;
    case RABIN:
        // avg selects the number of low hash bits to match
        if (avg_chunk & (avg_chunk - 1)) {
            throw ChunkConfigError(XSTR() << DVAL(avg_chunk) << "should be a power of 2 for rabin");
        }
        break;
    default:
        throw ChunkConfigError(XSTR() << "unknown algorithm " << int(algorithm));
    }
}

ChunkConfig::Algorithm
ChunkConfig::parse_algorithm(const std::string& name)
{
    if (name == "fastcdc") return FASTCDC;
    if (name == "rabin") return RABIN;
    throw ChunkConfigError(XSTR() << "unknown algorithm '" << name << "'");
}

const char*
ChunkConfig::algorithm_name(Algorithm algo)
{
    switch (algo) {
    case FASTCDC:
        return "fastcdc";
    case RABIN:
        return "rabin";
    }
    return "unknown";
}

std::ostream&
operator<<(std::ostream& os, const ChunkConfig& config)
{
    return os << ChunkConfig::algorithm_name(config.algorithm)
              << " min=" << config.min_chunk
              << " avg=" << config.avg_chunk
              << " max=" << config.max_chunk;
}

} // namespace puzzlefs
