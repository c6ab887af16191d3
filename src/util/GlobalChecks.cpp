// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include <fmt/format.h>
#include <stdexcept>

namespace deepcheck
{

void
printAssertFailureAndThrow(const char* s1, const char* file, int line)
{
    auto msg = fmt::format("{} at {}:{}", s1, file, line);
    LOG_ERROR(DEFAULT_LOG, "{}", msg);
    throw std::runtime_error(msg);
}
}
