/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <uv.h>

namespace puzzlefs
{

/**
 *
 * MUTEX
 *
 * C++ wrapper to libuv mutex (cross platform)
 *
 * NOTE: recursive lock will crash since libuv cannot guarantee it works cross platform.
 *
 */
class Mutex
{
public:
    explicit Mutex()
    {
        uv_mutex_init(&_mutex);
    }

    ~Mutex()
    {
        uv_mutex_destroy(&_mutex);
    }

    void lock()
    {
        uv_mutex_lock(&_mutex);
    }

    void unlock()
    {
        uv_mutex_unlock(&_mutex);
    }

    class Lock
    {
    public:
        explicit Lock(Mutex& m)
            : _m(m)
        {
            _m.lock();
        }

        ~Lock()
        {
            _m.unlock();
        }

    private:
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;
        Mutex& _m;
    };

private:
    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;
    uv_mutex_t _mutex;
};

} // namespace puzzlefs
