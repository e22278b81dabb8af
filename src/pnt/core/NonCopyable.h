// NonCopyable.h created on 2019-12-14 as part of pntkit project
// https://github.com/rbrich/xcikit
//
// Copyright 2019 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef PNT_CORE_NONCOPYABLE_H
#define PNT_CORE_NONCOPYABLE_H

namespace pnt::core {


/// Base for move-only types. Copy is disabled, move stays implicit
/// (the derived class decides whether it's movable).
class NonCopyable {
public:
    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator =(const NonCopyable&) = delete;

protected:
    NonCopyable() = default;
    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator =(NonCopyable&&) = default;
    ~NonCopyable() = default;
};


} // namespace pnt::core

#endif // include guard
