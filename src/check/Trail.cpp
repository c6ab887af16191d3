// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "check/Trail.h"
#include <fmt/format.h>

namespace deepcheck
{
namespace check
{

std::string
fieldTrail(std::string const& base, std::string const& name)
{
    if (base.empty())
    {
        return name;
    }
    return base + "." + name;
}

std::string
indexTrail(std::string const& base, size_t index)
{
    return fmt::format("{}[{}]", base, index);
}

std::string
keyTrail(std::string const& base, std::string const& key)
{
    return fmt::format("{}[{}]", base, key);
}
}
}
