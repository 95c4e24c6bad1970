/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <iostream>
#include <sstream>
#include <stdint.h>
#include <stdlib.h>
#include <string>
#include <vector>

#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>

namespace puzzlefs
{

/**
 * Backtrace captures the call stack of the current thread at construction.
 * Frames are resolved to (demangled) symbol names with dladdr,
 * frames without a resolved object file end the capture.
 */
class Backtrace
{
public:
    struct Frame
    {
        void* addr;
        std::string object;
        std::string func;
    };

    enum
    {
        MAX_DEPTH = 64
    };

    explicit Backtrace(int depth = 32)
    {
        void* trace[MAX_DEPTH];
        if (depth > MAX_DEPTH) depth = MAX_DEPTH;
        const int n = backtrace(trace, depth);
        // skip our own frame
        for (int i = 1; i < n; ++i) {
            Dl_info info;
            if (!dladdr(trace[i], &info) || !info.dli_fname || !info.dli_fname[0]) {
                break;
            }
            Frame f;
            f.addr = trace[i];
            f.object = info.dli_fname;
            f.func = _symbol_name(info);
            _frames.push_back(f);
        }
    }

    const std::vector<Frame>& frames() const { return _frames; }

    friend std::ostream& operator<<(std::ostream& os, const Backtrace& bt)
    {
        os << "Backtrace:" << std::endl;
        for (const Frame& f : bt._frames) {
            os << "\t" << f.addr << " " << f.object << " " << f.func << std::endl;
        }
        return os;
    }

private:
    static std::string _symbol_name(const Dl_info& info)
    {
        if (!info.dli_sname) {
            std::stringstream s;
            s << "0x" << std::hex << uintptr_t(info.dli_saddr);
            return s.str();
        }
        int status = -1;
        char* demangled = abi::__cxa_demangle(info.dli_sname, NULL, 0, &status);
        std::string name = (status == 0 && demangled) ? demangled : info.dli_sname;
        free(demangled);
        return name;
    }

    std::vector<Frame> _frames;
};

} // namespace puzzlefs
