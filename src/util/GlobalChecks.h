// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#pragma once

namespace deepcheck
{
[[noreturn]] void printAssertFailureAndThrow(const char* s1, const char* file,
                                             int line);

// This is like `assert()` but it is _not_ sensitive to the presence of
// NDEBUG, and it reports the failure by throwing std::runtime_error so that
// a misbehaving adapter never takes the calling test binary down with it.
#define releaseAssertOrThrow(e) \
    (static_cast<bool>(e) \
         ? void(0) \
         : deepcheck::printAssertFailureAndThrow(#e, __FILE__, __LINE__))
}
