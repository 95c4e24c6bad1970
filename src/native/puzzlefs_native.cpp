/* Copyright (C) 2016 PuzzleFS */
#include "chunk/chunk_config.h"
#include "util/napi.h"

namespace puzzlefs
{

void stream_chunker_napi(Napi::Env env, Napi::Object exports);

static Napi::Value
_set_debug_level(const Napi::CallbackInfo& info)
{
    set_chunk_debug_level(napi_get_i32(info[0]));
    return info.Env().Undefined();
}

Napi::Object
puzzlefs_native_napi(Napi::Env env, Napi::Object exports)
{
    stream_chunker_napi(env, exports);
    exports["set_debug_level"] = Napi::Function::New(env, _set_debug_level);
    return exports;
}

NODE_API_MODULE(puzzlefs_native, puzzlefs_native_napi)
} // namespace puzzlefs
