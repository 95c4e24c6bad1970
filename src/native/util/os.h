/* Copyright (C) 2016 PuzzleFS */
#pragma once

#include <sys/types.h>

namespace puzzlefs
{

// see os_linux.cpp

pid_t get_current_tid();

} // namespace puzzlefs
