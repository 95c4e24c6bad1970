/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include "common.h"

namespace puzzlefs
{

/**
 * Buf is a reference counted view over a byte allocation.
 * Copies and slices share the allocation, so passing a Buf around never copies bytes.
 */
class Buf
{
public:
    Buf()
        : _data(0), _len(0) {}

    explicit Buf(int len)
        : _alloc(new Alloc(len)), _data(_alloc->data()), _len(_alloc->length()) {}

    explicit Buf(int len, uint8_t fill)
        : _alloc(new Alloc(len)), _data(_alloc->data()), _len(_alloc->length())
    {
        memset(_data, fill, _len);
    }

    Buf(const Buf& other) { init(other); }

    Buf(Buf&& other) noexcept
        : _alloc(std::move(other._alloc)), _data(other._data), _len(other._len)
    {
        other._data = 0;
        other._len = 0;
    }

    ~Buf() {}

    Buf&
    operator=(const Buf& other)
    {
        init(other);
        return *this;
    }

    Buf&
    operator=(Buf&& other) noexcept
    {
        _alloc = std::move(other._alloc);
        _data = other._data;
        _len = other._len;
        other._data = 0;
        other._len = 0;
        return *this;
    }

    // copyful - allocates and copies len bytes
    static Buf
    copy(const void* data, int len)
    {
        Buf buf(len);
        if (len > 0) memcpy(buf._data, data, len);
        return buf;
    }

    inline uint8_t*
    data()
    {
        return _data;
    }

    inline const uint8_t*
    data() const
    {
        return _data;
    }

    inline int
    length() const
    {
        return _len;
    }

    inline uint8_t& operator[](int i) { return _data[i]; }

    inline const uint8_t& operator[](int i) const { return _data[i]; }

    inline void
    slice(int offset, int len)
    {
        // skip to offset
        if (offset > _len) {
            offset = _len;
        }
        if (offset < 0) {
            offset = 0;
        }
        _data += offset;
        _len -= offset;
        // truncate to length
        if (_len > len) {
            _len = len;
        }
        if (_len < 0) {
            _len = 0;
        }
    }

    // true when this buf holds the only reference to an owned allocation
    inline bool
    unique_alloc() const
    {
        return _alloc && _alloc.use_count() == 1;
    }

    inline bool
    same(const Buf& buf) const
    {
        return (_len == buf._len) && (_len == 0 || !memcmp(_data, buf._data, _len));
    }

    std::string hex() const;

private:
    class Alloc
    {
    private:
        uint8_t* _data;
        int _len;

    public:
        explicit Alloc(int len)
            : _data(new uint8_t[len]), _len(len) {}

        Alloc(const Alloc& other) = delete;
        Alloc& operator=(const Alloc& other) = delete;

        ~Alloc() { delete[] _data; }

        inline uint8_t*
        data()
        {
            return _data;
        }

        inline int
        length()
        {
            return _len;
        }
    };

    void
    init(const Buf& other)
    {
        _alloc = other._alloc;
        _data = other._data;
        _len = other._len;
    }

    std::shared_ptr<Alloc> _alloc;
    uint8_t* _data;
    int _len;
};

} // namespace puzzlefs
