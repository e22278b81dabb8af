// sys.h created on 2018-08-17 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2018–2025 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_CORE_SYS_H
#define PNT_CORE_SYS_H

#include <string>
#include <cstdint>
#include <cerrno>
#include <ctime>

#include <sys/types.h>

namespace pnt::core {


/// Convenience wrapper around gmtime_r
inline std::tm gmtime(std::time_t t)
{
    std::tm r {};
    gmtime_r(&t, &r);
    return r;
}


/// Convenience wrapper around localtime_r
inline std::tm localtime(std::time_t t)
{
    std::tm r {};
    localtime_r(&t, &r);
    return r;
}


// Integral thread ID
// The actual type is system-dependent.
#if defined(__linux__)
    using ThreadId = pid_t;
#elif defined(__APPLE__)
    using ThreadId = uint64_t;
#else
    using ThreadId = uintptr_t;
#endif

/// Get integral thread ID of this thread
///
/// Unlike `std::this_thread::get_id()`, this returns the real system-wide TID
/// (as seen in `top -H`), which is more useful in log output.
ThreadId get_thread_id();


/// Returns error message for `errno_`.
/// Calls a thread-safe variant of strerror.
std::string error_str(int errno_ = errno);


}  // namespace pnt::core

#endif // PNT_CORE_SYS_H
