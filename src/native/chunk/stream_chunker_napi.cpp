/* Copyright (C) 2016 PuzzleFS */
#include "../util/napi.h"
#include "stream_chunker.h"

namespace puzzlefs
{

DBG_INIT_VAR(chunk_debug_level);

#define STREAM_CHUNKER_JS_SIGNATURE "new StreamChunker({ min_chunk, avg_chunk, max_chunk, algorithm })"

/**
 * StreamChunkerWrap exposes a StreamChunker to javascript:
 *
 *      const chunker = new (require('puzzlefs_native').StreamChunker)({ min_chunk, avg_chunk, max_chunk });
 *      chunker.append(buffer);
 *      chunker.finish();
 *      for (const { offset, length, data } of chunker.drain()) ...
 *
 * Missing options are taken from the image profile.
 */
struct StreamChunkerWrap : public Napi::ObjectWrap<StreamChunkerWrap>
{
    std::unique_ptr<StreamChunker> _chunker;
    static Napi::FunctionReference constructor;

    static void init(Napi::Env env, Napi::Object exports)
    {
        Napi::Function func = DefineClass(
            env,
            "StreamChunker",
            {
                InstanceMethod<&StreamChunkerWrap::append>("append"),
                InstanceMethod<&StreamChunkerWrap::finish>("finish"),
                InstanceMethod<&StreamChunkerWrap::drain>("drain"),
                InstanceAccessor<&StreamChunkerWrap::get_finished>("finished"),
            });
        constructor = Napi::Persistent(func);
        constructor.SuppressDestruct();
        exports["StreamChunker"] = func;
    }

    StreamChunkerWrap(const Napi::CallbackInfo& info)
        : Napi::ObjectWrap<StreamChunkerWrap>(info)
    {
        Napi::Env env = info.Env();
        ChunkConfig config = ChunkConfig::image_profile();
        if (napi_is_defined(info[0])) {
            if (!info[0].IsObject()) {
                throw Napi::TypeError::New(
                    env, "Argument 'options' should be Object - " STREAM_CHUNKER_JS_SIGNATURE);
            }
            auto options = info[0].As<Napi::Object>();
            config.min_chunk = napi_get_i32_or(options, "min_chunk", config.min_chunk);
            config.avg_chunk = napi_get_i32_or(options, "avg_chunk", config.avg_chunk);
            config.max_chunk = napi_get_i32_or(options, "max_chunk", config.max_chunk);
            try {
                config.algorithm = ChunkConfig::parse_algorithm(
                    napi_get_str_or(options, "algorithm", ChunkConfig::algorithm_name(config.algorithm)));
                _chunker.reset(new StreamChunker(config));
            } catch (const ChunkConfigError& e) {
                throw Napi::Error::New(env, e.what());
            }
        } else {
            _chunker.reset(new StreamChunker(config));
        }
        DBG1("StreamChunkerWrap: " << config);
    }

    Napi::Value append(const Napi::CallbackInfo& info)
    {
        Napi::Env env = info.Env();
        if (!info[0].IsBuffer()) {
            throw Napi::TypeError::New(env, "Argument 'buffer' should be Buffer - StreamChunker.append(buffer)");
        }
        if (_chunker->finished()) {
            throw Napi::Error::New(env, "StreamChunker.append called after finish");
        }
        auto buf = info[0].As<Napi::Buffer<uint8_t>>();
        size_t n = _chunker->append(buf.Data(), buf.Length());
        return Napi::Number::New(env, double(n));
    }

    Napi::Value finish(const Napi::CallbackInfo& info)
    {
        if (_chunker->finished()) {
            throw Napi::Error::New(info.Env(), "StreamChunker.finish called twice");
        }
        _chunker->finish();
        return info.Env().Undefined();
    }

    Napi::Value drain(const Napi::CallbackInfo& info)
    {
        Napi::Env env = info.Env();
        std::vector<ChunkWithData> chunks;
        _chunker->drain(chunks);
        auto arr = Napi::Array::New(env, chunks.size());
        for (uint32_t i = 0; i < chunks.size(); ++i) {
            const ChunkWithData& chunk = chunks[i];
            auto obj = Napi::Object::New(env);
            obj["offset"] = Napi::Number::New(env, double(chunk.offset));
            obj["length"] = Napi::Number::New(env, chunk.length);
            obj["data"] = Napi::Buffer<uint8_t>::Copy(env, chunk.data.data(), chunk.data.length());
            arr[i] = obj;
        }
        return arr;
    }

    Napi::Value get_finished(const Napi::CallbackInfo& info)
    {
        return Napi::Boolean::New(info.Env(), _chunker->finished());
    }
};

Napi::FunctionReference StreamChunkerWrap::constructor;

void
stream_chunker_napi(Napi::Env env, Napi::Object exports)
{
    StreamChunkerWrap::init(env, exports);
}

} // namespace puzzlefs
