// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "dump/Dumpers.h"
#include "dump/Printer.h"
#include "util/Logging.h"
#include <charconv>
#include <fmt/format.h>
#include <typeinfo>

namespace deepcheck
{
namespace dump
{

namespace
{

std::string
usageError(Dump const& dmp, int lvl, char const* dumper, Value const& val)
{
    CLOG_DEBUG(Dump, "{} called with a {} value of kind {}", dumper,
               val.typeName(), kindName(val.kind()));
    return Printer(dmp).tab(dmp.indent() + lvl).write(ValErrUsage).str();
}

std::string
leaf(Dump const& dmp, int lvl, std::string_view str)
{
    return Printer(dmp).tab(dmp.indent() + lvl).write(str).str();
}

// Renders a child value so it can follow a "name: " prefix on the same line.
std::string
nested(Dump const& dmp, Value const& val, int lvl)
{
    return untab(dmp, dmp.value(val, lvl), dmp.indent() + lvl);
}

// Shortest fixed notation that reads back as the same F.
template <typename F>
std::string
formatFloat(F f)
{
    std::string buf(64, '\0');
    while (true)
    {
        auto res = std::to_chars(buf.data(), buf.data() + buf.size(), f,
                                 std::chars_format::fixed);
        if (res.ec == std::errc())
        {
            buf.resize(static_cast<size_t>(res.ptr - buf.data()));
            return buf;
        }
        buf.resize(buf.size() * 4);
    }
}

std::string
formatFloat(Value const& val)
{
    if (val.typeId() == typeid(float))
    {
        return formatFloat(static_cast<float>(val.floatValue()));
    }
    if (val.typeId() == typeid(double))
    {
        return formatFloat(static_cast<double>(val.floatValue()));
    }
    return formatFloat(val.floatValue());
}

std::string
formatComplex(std::complex<double> c)
{
    auto imag = formatFloat(c.imag());
    if (imag.empty() || (imag[0] != '-' && imag[0] != '+'))
    {
        imag.insert(imag.begin(), '+');
    }
    return fmt::format("({}{}i)", formatFloat(c.real()), imag);
}

std::string
formatString(Dump const& dmp, std::string_view str)
{
    if (dmp.isFlatStringsForced() || dmp.isFlat() ||
        (dmp.flatStrings() > 0 && str.size() <= dmp.flatStrings()))
    {
        return fmt::format("{:?}", str);
    }
    if (str.find('\n') != std::string_view::npos)
    {
        return std::string(str);
    }
    return fmt::format("\"{}\"", str);
}

// Writes `open`, the elements produced by `each` one per line, and "}".
template <typename Each>
std::string
composite(Dump const& dmp, int lvl, std::string const& open, size_t count,
          Each each)
{
    Printer prn(dmp);
    prn.tab(dmp.indent() + lvl).write(open);
    if (count == 0)
    {
        return prn.write("}").str();
    }
    prn.nl();
    for (size_t i = 0; i < count; ++i)
    {
        prn.tab(dmp.indent() + lvl + 1);
        each(prn, i);
        prn.separator(i + 1 == count);
    }
    return prn.tab(dmp.indent() + lvl).write("}").str();
}
}

std::string
simpleDumper(Dump const& dmp, int lvl, Value const& val)
{
    std::string str;
    switch (val.kind())
    {
    case Kind::BOOL:
        str = val.boolValue() ? "true" : "false";
        break;
    case Kind::INT:
        str = fmt::format("{}", val.intValue());
        break;
    case Kind::UINT:
        str = fmt::format("{}", val.uintValue());
        break;
    case Kind::FLOAT:
        str = formatFloat(val);
        break;
    case Kind::COMPLEX:
        str = formatComplex(val.complexValue());
        break;
    case Kind::STRING:
        str = val.isNil() ? std::string(ValNil)
                          : formatString(dmp, val.stringValue());
        break;
    default:
        return usageError(dmp, lvl, "simpleDumper", val);
    }
    return leaf(dmp, lvl, str);
}

std::string
ptrDumper(Dump const& dmp, int lvl, Value const& val)
{
    if (val.kind() != Kind::POINTER)
    {
        return usageError(dmp, lvl, "ptrDumper", val);
    }
    if (dmp.isPtrAddr())
    {
        return leaf(dmp, lvl, fmt::format("<0x{:x}>", val.address()));
    }
    if (val.isNil())
    {
        return leaf(dmp, lvl, ValNil);
    }
    return dmp.value(val.elem(), lvl);
}

std::string
recordDumper(Dump const& dmp, int lvl, Value const& val)
{
    if (val.kind() != Kind::RECORD)
    {
        return usageError(dmp, lvl, "recordDumper", val);
    }
    auto fields = val.fields();
    return composite(dmp, lvl, "{", fields.size(), [&](Printer& prn, size_t i) {
        prn.write(fields[i].name)
            .write(": ")
            .write(nested(dmp, fields[i].value, lvl + 1));
    });
}

std::string
sequenceDumper(Dump const& dmp, int lvl, Value const& val)
{
    if (!isSequence(val.kind()))
    {
        return usageError(dmp, lvl, "sequenceDumper", val);
    }
    return composite(dmp, lvl, val.typeName() + "{", val.len(),
                     [&](Printer& prn, size_t i) {
                         prn.write(nested(dmp, val.index(i), lvl + 1));
                     });
}

std::string
mapDumper(Dump const& dmp, int lvl, Value const& val)
{
    if (val.kind() != Kind::MAP)
    {
        return usageError(dmp, lvl, "mapDumper", val);
    }
    auto keys = dmp.sortedKeys(val);
    return composite(dmp, lvl, val.typeName() + "{", keys.size(),
                     [&](Printer& prn, size_t i) {
                         prn.write(keys[i].first)
                             .write(": ")
                             .write(nested(dmp, val.lookup(keys[i].second),
                                           lvl + 1));
                     });
}

std::string
interfaceDumper(Dump const& dmp, int lvl, Value const& val)
{
    if (val.kind() != Kind::INTERFACE)
    {
        return usageError(dmp, lvl, "interfaceDumper", val);
    }
    return dmp.value(val.elem(), lvl);
}

std::string
funcDumper(Dump const& dmp, int lvl, Value const& val)
{
    if (val.kind() != Kind::FUNC)
    {
        return usageError(dmp, lvl, "funcDumper", val);
    }
    if (!dmp.isPtrAddr())
    {
        return leaf(dmp, lvl, fmt::format("{}({})", ValFunc, ValAddr));
    }
    return leaf(dmp, lvl, fmt::format("{}(<0x{:x}>)", ValFunc, val.address()));
}

std::string
chanDumper(Dump const& dmp, int lvl, Value const& val)
{
    if (val.kind() != Kind::CHAN)
    {
        return usageError(dmp, lvl, "chanDumper", val);
    }
    if (!dmp.isPtrAddr())
    {
        return leaf(dmp, lvl, fmt::format("({})({})", val.typeName(), ValAddr));
    }
    return leaf(dmp, lvl,
                fmt::format("({})(<0x{:x}>)", val.typeName(), val.address()));
}

std::string
otherDumper(Dump const& dmp, int lvl, Value const& val)
{
    if (val.kind() != Kind::OTHER)
    {
        return usageError(dmp, lvl, "otherDumper", val);
    }
    return leaf(dmp, lvl, val.render());
}
}
}
