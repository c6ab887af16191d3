// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"
#include <cctype>
#include <sstream>

namespace deepcheck
{

bool
iequals(std::string const& a, std::string const& b)
{
    size_t sz = a.size();
    if (b.size() != sz)
        return false;
    for (size_t i = 0; i < sz; ++i)
        if (tolower(a[i]) != tolower(b[i]))
            return false;
    return true;
}

std::string
trim(std::string const& str)
{
    auto first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
    {
        return std::string();
    }
    auto last = str.find_last_not_of(" \t");
    return str.substr(first, last - first + 1);
}

std::vector<std::string>
splitAndTrim(std::string const& str, char sep)
{
    std::vector<std::string> res;
    std::istringstream stream(str);
    std::string piece;
    while (std::getline(stream, piece, sep))
    {
        piece = trim(piece);
        if (!piece.empty())
        {
            res.emplace_back(piece);
        }
    }
    return res;
}

bool
isPrintableChar(unsigned char c)
{
    return c >= 0x20 && c < 0x7f;
}
}
