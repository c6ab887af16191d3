#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstddef>
#include <string>

// A trail names a location inside a compared value, e.g. `Items[1].Tags["a"]`.
// The root trail is empty. Trails are extended, never modified.

namespace deepcheck
{
namespace check
{

std::string fieldTrail(std::string const& base, std::string const& name);
std::string indexTrail(std::string const& base, size_t index);

// `key` is the Dump::keyString projection of the map key.
std::string keyTrail(std::string const& base, std::string const& key);
}
}
