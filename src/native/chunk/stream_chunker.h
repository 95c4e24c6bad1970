/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <memory>
#include <vector>

#include "../util/buf.h"
#include "boundary_detector.h"
#include "chunk_config.h"
#include "chunk_queue.h"

namespace puzzlefs
{

/**
 *
 * StreamChunker
 *
 * Content defined chunking of a single file stream, fed with writes of any size.
 * The chunks are the same as chunking the whole file in one buffer,
 * while memory is bounded by a window of max_chunk bytes.
 *
 * Usage - one instance per file:
 *      append() any number of times, finish() once, and drain() whenever
 *      the chunks should be handed to the blob store.
 *
 * Not thread safe, but instances share nothing so files can be chunked
 * in parallel on different threads.
 *
 */
class StreamChunker
{
public:
    // throws ChunkConfigError on invalid config
    explicit StreamChunker(const ChunkConfig& config);

    ~StreamChunker();

    /**
     * copies all of data into the window, chunking whenever the window is full.
     * returns len.
     * calling after finish() is a fatal error.
     */
    size_t append(const void* data, size_t len);

    /**
     * chunks the remaining bytes, the last chunk may be shorter than min_chunk.
     * must be called exactly once after the last append.
     */
    void finish();

    /**
     * moves the chunks produced since the previous drain to the end of out.
     */
    void drain(std::vector<ChunkWithData>& out);

    const ChunkConfig& config() const { return _config; }
    bool finished() const { return _finished; }
    int64_t bytes_appended() const { return _bytes_appended; }
    int64_t bytes_chunked() const { return _global_offset; }
    int window_capacity() const { return _window.length(); }
    int window_used() const { return _window_used; }
    size_t pending_chunks() const { return _pending.size(); }

private:
    StreamChunker(const StreamChunker&) = delete;
    StreamChunker& operator=(const StreamChunker&) = delete;

    class Guard;

    const ChunkConfig _config;
    const std::shared_ptr<const BoundaryDetector> _detector;
    Buf _window;
    int _window_used;
    int64_t _global_offset;
    int64_t _bytes_appended;
    bool _finished;
    bool _busy;
    ChunkQueue _pending;
    BoundaryDetector::Cuts _cuts;

    void _render(bool is_final);
};

} // namespace puzzlefs
