/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <node_api.h>

#ifdef __cplusplus
    #include <napi.h>
#endif

#include <string>

namespace puzzlefs
{

inline bool
napi_is_defined(Napi::Value v)
{
    return !v.IsEmpty() && !v.IsUndefined() && !v.IsNull();
}

inline int32_t
napi_get_i32(Napi::Value v)
{
    return v.As<Napi::Number>().Int32Value();
}

inline std::string
napi_get_str(Napi::Value v)
{
    return v.As<Napi::String>().Utf8Value();
}

// object property getters with default value

inline int32_t
napi_get_i32_or(Napi::Object obj, const char* key, int32_t default_value)
{
    auto v = obj.Get(key);
    if (!v.IsNumber()) return default_value;
    return napi_get_i32(v);
}

inline std::string
napi_get_str_or(Napi::Object obj, const char* key, const std::string& default_value)
{
    auto v = obj.Get(key);
    if (!v.IsString()) return default_value;
    return napi_get_str(v);
}

} // namespace puzzlefs
