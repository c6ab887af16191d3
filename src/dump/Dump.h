#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "reflect/Reflect.h"
#include <functional>
#include <map>
#include <string>
#include <typeindex>
#include <vector>

namespace deepcheck
{
namespace dump
{

// Placeholders used in rendered output.
extern char const* const ValNil;
extern char const* const ValAddr;
extern char const* const ValFunc;
extern char const* const ValInaccessible;
// Returned by a kind specific renderer called with a value of another kind.
extern char const* const ValErrUsage;

class Dump;

// Renders `val` at nesting level `lvl`. The result carries its own
// indentation, see Printer::tab.
using Dumper =
    std::function<std::string(Dump const& dmp, int lvl, Value const& val)>;

using DumpOption = std::function<void(Dump&)>;

// Value to string renderer configuration. Copies are cheap and independent.
class Dump
{
    bool mFlat{false};
    bool mFlatStringsForced{false};
    size_t mFlatStrings{0};
    bool mPtrAddr{false};
    int mIndent{0};
    int mTabWidth{2};
    std::map<std::type_index, Dumper> mDumpers;

  public:
    Dump() = default;
    explicit Dump(std::vector<DumpOption> const& opts);

    // Everything on one line.
    bool
    isFlat() const
    {
        return mFlat;
    }

    // Strings always quoted on one line, used for map keys.
    bool
    isFlatStringsForced() const
    {
        return mFlatStringsForced;
    }

    // Strings up to this length are quoted on one line, 0 disables.
    size_t
    flatStrings() const
    {
        return mFlatStrings;
    }

    // Render reference-like values by address.
    bool
    isPtrAddr() const
    {
        return mPtrAddr;
    }

    // Extra indentation applied at every level.
    int
    indent() const
    {
        return mIndent;
    }

    int
    tabWidth() const
    {
        return mTabWidth;
    }

    Dump& setFlat(bool flat);
    Dump& setFlatStrings(size_t length);
    Dump& setPtrAddr(bool ptrAddr);
    Dump& setIndent(int indent);
    Dump& setTabWidth(int width);

    // Registers a renderer consulted before the kind based ones.
    Dump& setDumper(std::type_index type, Dumper dumper);
    bool hasDumper(std::type_index type) const;

    // Renders `val` at level zero.
    std::string any(Value const& val) const;

    template <typename T>
    std::string
    any(T const& v) const
    {
        return any(Value::of(v));
    }

    // Renders `val` at level `lvl`, dispatching on custom renderers first
    // and the value kind second.
    std::string value(Value const& val, int lvl) const;

    // Single line rendering used to order map keys and to name them in
    // trails.
    std::string keyString(Value const& key) const;

    // Keys of a MAP value paired with their keyString, ordered by that
    // string. Keys rendering the same keep their iteration order.
    std::vector<std::pair<std::string, Value>>
    sortedKeys(Value const& map) const;
};

DumpOption flat();
DumpOption flatStrings(size_t length);
DumpOption indent(int indent);
DumpOption ptrAddr();
DumpOption tabWidth(int width);
DumpOption withDumper(std::type_index type, Dumper dumper);

template <typename T>
DumpOption
withDumper(Dumper dumper)
{
    return withDumper(adapterOf<T>().id(), std::move(dumper));
}
}
}
