// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "dump/Printer.h"
#include "dump/Dump.h"

namespace deepcheck
{
namespace dump
{

namespace
{
size_t
tabSize(Dump const& dmp, int n)
{
    if (dmp.isFlat() || n <= 0 || dmp.tabWidth() <= 0)
    {
        return 0;
    }
    return static_cast<size_t>(n) * static_cast<size_t>(dmp.tabWidth());
}
}

Printer::Printer(Dump const& dmp) : mDump(dmp)
{
}

Printer&
Printer::tab(int n)
{
    mBuf.append(tabSize(mDump, n), ' ');
    return *this;
}

Printer&
Printer::nl()
{
    if (!mDump.isFlat())
    {
        mBuf.push_back('\n');
    }
    return *this;
}

Printer&
Printer::write(std::string_view s)
{
    mBuf.append(s);
    return *this;
}

Printer&
Printer::separator(bool last)
{
    if (!mDump.isFlat())
    {
        mBuf.append(",\n");
    }
    else if (!last)
    {
        mBuf.append(", ");
    }
    return *this;
}

std::string
untab(Dump const& dmp, std::string const& s, int n)
{
    auto size = tabSize(dmp, n);
    if (size > s.size() || s.find_first_not_of(' ') < size)
    {
        return s;
    }
    return s.substr(size);
}
}
}
