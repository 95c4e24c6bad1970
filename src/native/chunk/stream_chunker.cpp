/* Copyright (C) 2016 PuzzleFS */
#include "stream_chunker.h"

#include <algorithm>

namespace puzzlefs
{

DBG_INIT_VAR(chunk_debug_level);

// marks the chunker busy for the scope of a call, catching reentrant use
class StreamChunker::Guard
{
public:
    explicit Guard(StreamChunker& chunker)
        : _chunker(chunker)
    {
        REQUIRE(!_chunker._busy, "StreamChunker is not reentrant");
        _chunker._busy = true;
    }

    ~Guard()
    {
        _chunker._busy = false;
    }

private:
    StreamChunker& _chunker;
};

static const ChunkConfig&
_validated(const ChunkConfig& config)
{
    config.validate();
    return config;
}

StreamChunker::StreamChunker(const ChunkConfig& config)
    : _config(_validated(config))
    , _detector(make_boundary_detector(config.algorithm))
    , _window(config.max_chunk)
    , _window_used(0)
    , _global_offset(0)
    , _bytes_appended(0)
    , _finished(false)
    , _busy(false)
{
    DBG1("StreamChunker: " << _config << " window " << _window.length());
}

StreamChunker::~StreamChunker()
{
}

size_t
StreamChunker::append(const void* data, size_t len)
{
    REQUIRE(!_finished, "StreamChunker::append after finish " << DVAL(len));
    Guard guard(*this);

    const uint8_t* input = reinterpret_cast<const uint8_t*>(data);
    const size_t capacity = _window.length();
    size_t pos = 0;

    while (pos < len) {
        const size_t room = std::min(capacity - _window_used, len - pos);
        memcpy(_window.data() + _window_used, input + pos, room);
        _window_used += room;
        pos += room;

        // a full window always resolves at least one chunk
        if (size_t(_window_used) == capacity) {
            _render(false);
        }
    }

    _bytes_appended += len;
    return len;
}

void
StreamChunker::finish()
{
    REQUIRE(!_finished, "StreamChunker::finish called twice");
    Guard guard(*this);
    _render(true);
    _finished = true;
    DBG1("StreamChunker::finish: " << DVAL(_bytes_appended) << DVAL(_global_offset));
}

void
StreamChunker::drain(std::vector<ChunkWithData>& out)
{
    Guard guard(*this);
    _pending.take_all(out);
}

void
StreamChunker::_render(bool is_final)
{
    uint8_t* const window = _window.data();

    _cuts.clear();
    _detector->detect(
        window,
        _window_used,
        _config.min_chunk,
        _config.avg_chunk,
        _config.max_chunk,
        is_final,
        _cuts);

    if (_cuts.empty()) {
        DBG3("StreamChunker::_render: no boundary " << DVAL(_window_used) << DVAL(is_final));
        return;
    }

    int consumed = 0;
    for (const BoundaryDetector::Cut& cut : _cuts) {
        ASSERT(cut.offset == consumed, DVAL(cut.offset) << DVAL(consumed));
        _pending.push(ChunkWithData(
            _global_offset + cut.offset,
            Buf::copy(window + consumed, cut.length)));
        consumed += cut.length;
    }
    _global_offset += consumed;

    // move the unresolved tail to the front of the window
    const int leftover = _window_used - consumed;
    ASSERT(leftover >= 0 && leftover < _window.length(), DVAL(leftover));
    ASSERT(!is_final || leftover == 0, DVAL(leftover));
    if (leftover > 0) {
        memmove(window, window + consumed, leftover);
    }
    _window_used = leftover;

    DBG2("StreamChunker::_render: "
        << DVAL(is_final) << DVAL(_cuts.size()) << DVAL(consumed)
        << DVAL(leftover) << DVAL(_global_offset));
}

} // namespace puzzlefs
