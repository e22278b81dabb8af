// log.cpp created on 2018-03-01 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2018, 2020 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "log.h"
#include <pnt/core/sys.h>

#include <fmt/chrono.h>
#include <cstdio>
#include <ctime>

namespace pnt::core {


// 0..4 => log level (Trace..Error)
static constexpr const char* c_level_name[] = {
        "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR",
};


Logger& Logger::default_instance(Logger::Level initial_level)
{
    static Logger logger(initial_level);
    return logger;
}


void Logger::log(Logger::Level lvl, std::string_view msg)
{
    if (lvl < m_level)
        return;

    m_handler(lvl, msg);
}


void Logger::default_handler(Logger::Level lvl, std::string_view msg)
{
    const auto lvl_num = static_cast<int>(lvl);
    if (lvl_num < 0 || lvl_num >= int(std::size(c_level_name)))
        return;
    const auto tm = localtime(std::time(nullptr));
    const auto tid = get_thread_id() & 0xFFFFFF;  // clip to 6 hex digits
    // multi-line messages are continued with indented "..."
    size_t start = 0;
    bool first = true;
    for (;;) {
        const auto end = msg.find('\n', start);
        const auto line = msg.substr(start, end == std::string_view::npos ? end : end - start);
        if (first)
            fmt::print(stderr, "{:%F %T} {:6x}  {}  {}\n", tm, tid, c_level_name[lvl_num], line);
        else
            fmt::print(stderr, "{:28}...    {}\n", "", line);
        if (end == std::string_view::npos)
            break;
        start = end + 1;
        first = false;
    }
}


std::string log::LastErrorPlaceholder::message(bool error_code)
{
    if (error_code)
        return std::to_string(errno);
    return error_str();
}


} // namespace pnt::core
