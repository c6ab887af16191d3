// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "dump/Dump.h"
#include "dump/Dumpers.h"
#include "dump/Printer.h"
#include "util/Logging.h"
#include <algorithm>
#include <stdexcept>

namespace deepcheck
{
namespace dump
{

char const* const ValNil = "nullptr";
char const* const ValAddr = "<addr>";
char const* const ValFunc = "<func>";
char const* const ValInaccessible = "<inaccessible>";
char const* const ValErrUsage = "<dump-usage-error>";

Dump::Dump(std::vector<DumpOption> const& opts)
{
    for (auto const& opt : opts)
    {
        opt(*this);
    }
}

Dump&
Dump::setFlat(bool flat)
{
    mFlat = flat;
    return *this;
}

Dump&
Dump::setFlatStrings(size_t length)
{
    mFlatStrings = length;
    return *this;
}

Dump&
Dump::setPtrAddr(bool ptrAddr)
{
    mPtrAddr = ptrAddr;
    return *this;
}

Dump&
Dump::setIndent(int indent)
{
    mIndent = std::max(indent, 0);
    return *this;
}

Dump&
Dump::setTabWidth(int width)
{
    mTabWidth = std::max(width, 0);
    return *this;
}

Dump&
Dump::setDumper(std::type_index type, Dumper dumper)
{
    if (!dumper)
    {
        CLOG_WARNING(Dump, "Ignoring empty renderer for type '{}'",
                     type.name());
        return *this;
    }
    mDumpers[type] = std::move(dumper);
    return *this;
}

bool
Dump::hasDumper(std::type_index type) const
{
    return mDumpers.find(type) != mDumpers.end();
}

std::string
Dump::any(Value const& val) const
{
    return value(val, 0);
}

std::string
Dump::value(Value const& val, int lvl) const
{
    if (!val.isValid())
    {
        return Printer(*this).tab(mIndent + lvl).write(ValNil).str();
    }
    if (!val.isAccessible())
    {
        return Printer(*this).tab(mIndent + lvl).write(ValInaccessible).str();
    }

    auto it = mDumpers.find(val.typeId());
    if (it != mDumpers.end())
    {
        CLOG_TRACE(Dump, "Custom renderer for {}", val.typeName());
        return it->second(*this, lvl, val);
    }

    switch (val.kind())
    {
    case Kind::BOOL:
    case Kind::INT:
    case Kind::UINT:
    case Kind::FLOAT:
    case Kind::COMPLEX:
    case Kind::STRING:
        return simpleDumper(*this, lvl, val);
    case Kind::POINTER:
        return ptrDumper(*this, lvl, val);
    case Kind::RECORD:
        return recordDumper(*this, lvl, val);
    case Kind::ARRAY:
    case Kind::SLICE:
        return sequenceDumper(*this, lvl, val);
    case Kind::MAP:
        return mapDumper(*this, lvl, val);
    case Kind::INTERFACE:
        return interfaceDumper(*this, lvl, val);
    case Kind::FUNC:
        return funcDumper(*this, lvl, val);
    case Kind::CHAN:
        return chanDumper(*this, lvl, val);
    case Kind::OTHER:
        return otherDumper(*this, lvl, val);
    case Kind::INVALID:
        break;
    }
    throw std::logic_error(
        fmt::format("no renderer for {} ({})", val.typeName(),
                    kindName(val.kind())));
}

std::string
Dump::keyString(Value const& key) const
{
    Dump keyDump(*this);
    keyDump.mFlat = true;
    keyDump.mFlatStringsForced = true;
    keyDump.mIndent = 0;
    return keyDump.value(key, 0);
}

std::vector<std::pair<std::string, Value>>
Dump::sortedKeys(Value const& map) const
{
    std::vector<std::pair<std::string, Value>> res;
    for (auto& key : map.keys())
    {
        auto str = keyString(key);
        res.emplace_back(std::move(str), std::move(key));
    }
    std::stable_sort(res.begin(), res.end(),
                     [](auto const& a, auto const& b) {
                         return a.first < b.first;
                     });
    return res;
}

DumpOption
flat()
{
    return [](Dump& dmp) { dmp.setFlat(true); };
}

DumpOption
flatStrings(size_t length)
{
    return [length](Dump& dmp) { dmp.setFlatStrings(length); };
}

DumpOption
indent(int indent)
{
    return [indent](Dump& dmp) { dmp.setIndent(indent); };
}

DumpOption
ptrAddr()
{
    return [](Dump& dmp) { dmp.setPtrAddr(true); };
}

DumpOption
tabWidth(int width)
{
    return [width](Dump& dmp) { dmp.setTabWidth(width); };
}

DumpOption
withDumper(std::type_index type, Dumper dumper)
{
    return [type, dumper = std::move(dumper)](Dump& dmp) {
        dmp.setDumper(type, dumper);
    };
}
}
}
