/* Copyright (C) 2016 PuzzleFS */
#include "boundary_detector.h"

namespace puzzlefs
{

std::shared_ptr<const BoundaryDetector>
make_boundary_detector(ChunkConfig::Algorithm algorithm)
{
    static const std::shared_ptr<const BoundaryDetector> fastcdc(new FastCdcDetector());
    static const std::shared_ptr<const BoundaryDetector> rabin(new RabinDetector());
    switch (algorithm) {
    case ChunkConfig::FASTCDC:
        return fastcdc;
    case ChunkConfig::RABIN:
        return rabin;
    }
    throw ChunkConfigError(XSTR() << "unknown algorithm " << int(algorithm));
}

} // namespace puzzlefs
