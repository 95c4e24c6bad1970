/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <vector>

#include "../util/buf.h"

namespace puzzlefs
{

/**
 * A chunk of a file stream with its own copy of the bytes.
 * offset is absolute in the stream, data.length() == length.
 */
struct ChunkWithData
{
    int64_t offset;
    int length;
    Buf data;

    ChunkWithData()
        : offset(0), length(0) {}

    ChunkWithData(int64_t offset_, Buf data_)
        : offset(offset_), length(data_.length()), data(std::move(data_)) {}
};

/**
 * ChunkQueue holds finalized chunks until the consumer takes them.
 * It is not bounded, the consumer should take_all() to keep memory in check.
 */
class ChunkQueue
{
public:
    ChunkQueue()
        : _pending_bytes(0) {}

    void
    push(ChunkWithData&& chunk)
    {
        _pending_bytes += chunk.length;
        _chunks.push_back(std::move(chunk));
    }

    // moves all the pending chunks to the end of out, in order
    void
    take_all(std::vector<ChunkWithData>& out)
    {
        if (out.empty()) {
            out.swap(_chunks);
        } else {
            out.reserve(out.size() + _chunks.size());
            for (auto& chunk : _chunks) {
                out.push_back(std::move(chunk));
            }
        }
        _chunks.clear();
        _pending_bytes = 0;
    }

    size_t size() const { return _chunks.size(); }
    bool empty() const { return _chunks.empty(); }
    int64_t pending_bytes() const { return _pending_bytes; }

private:
    std::vector<ChunkWithData> _chunks;
    int64_t _pending_bytes;
};

} // namespace puzzlefs
