// sys.cpp created on 2018-08-17 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2018–2025 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "sys.h"

#include <cstring>

#if defined(__linux__)
    #include <sys/syscall.h>
    #include <unistd.h>
#elif defined(__APPLE__)
    #include <pthread.h>
#else
    #include <pthread.h>
#endif

namespace pnt::core {


ThreadId get_thread_id()
{
#if defined(__linux__)
    return (ThreadId) syscall(SYS_gettid);
#elif defined(__APPLE__)
    uint64_t tid = 0;
    pthread_threadid_np(pthread_self(), &tid);
    return tid;
#else
    return (ThreadId) pthread_self();
#endif
}


std::string error_str(int errno_)
{
    char buf[200] = {};
#if defined(HAVE_GNU_STRERROR_R)
    return strerror_r(errno_, buf, sizeof buf);
#else
    if (strerror_r(errno_, buf, sizeof buf) == 0) {
        return buf;
    }
    return "Unknown error (" + std::to_string(errno_) + ')';
#endif
}


}  // namespace pnt::core
