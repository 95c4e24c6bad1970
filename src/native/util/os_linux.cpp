/* Copyright (C) 2016 PuzzleFS */
#ifdef __linux__

#include "os.h"

#include <sys/syscall.h>
#include <unistd.h>

namespace puzzlefs
{

pid_t
get_current_tid()
{
    return syscall(SYS_gettid);
}

} // namespace puzzlefs

#endif
