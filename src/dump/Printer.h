#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <string>
#include <string_view>

namespace deepcheck
{
namespace dump
{

class Dump;

// Accumulates rendered output. Tabs and line breaks are dropped when the
// configuration asks for flat output.
class Printer
{
    Dump const& mDump;
    std::string mBuf;

  public:
    explicit Printer(Dump const& dmp);

    // Writes `n` tabs of Dump::tabWidth spaces.
    Printer& tab(int n);
    Printer& nl();
    Printer& write(std::string_view s);

    // Writes an element separator: ",\n" or ", " when flat. The last
    // element of a flat list gets none.
    Printer& separator(bool last);

    std::string const&
    str() const
    {
        return mBuf;
    }
};

// Removes the indentation Printer::tab(n) would have written.
std::string untab(Dump const& dmp, std::string const& s, int n);
}
}
