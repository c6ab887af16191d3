#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <string>
#include <vector>

namespace deepcheck
{

// case-insensitive ASCII comparison
bool iequals(std::string const& a, std::string const& b);

// returns the string without leading and trailing spaces and tabs
std::string trim(std::string const& str);

// splits on `sep`, trims each piece and drops the empty ones
std::vector<std::string> splitAndTrim(std::string const& str, char sep);

// returns true when `c` is a printable ASCII character
bool isPrintableChar(unsigned char c);
}
