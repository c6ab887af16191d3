// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "check/Equal.h"
#include "check/Trail.h"
#include "dump/Printer.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"
#include "util/types.h"
#include <fmt/format.h>
#include <iterator>

namespace deepcheck
{
namespace check
{

using notice::Notice;

namespace
{

void
append(std::vector<Notice>& to, std::vector<Notice>&& from)
{
    to.insert(to.end(), std::make_move_iterator(from.begin()),
              std::make_move_iterator(from.end()));
}

std::vector<Notice>
fromChecker(Checker const& checker, Value const& want, Value const& have,
            Options const& ops)
{
    return notice::unwrap(checker(want, have, ops));
}

std::vector<Notice>
lengthError(Value const& want, Value const& have, Options const& ops)
{
    ops.logTrail();
    auto n = equalError(want, have, ops);
    n.prepend("have len", "{}", have.len()).prepend("want len", "{}", want.len());
    return {n};
}

std::vector<Notice>
leaf(bool equal, Value const& want, Value const& have, Options const& ops)
{
    ops.logTrail();
    if (equal)
    {
        return {};
    }
    return {equalError(want, have, ops)};
}

std::vector<Notice>
compareRecords(Value const& want, Value const& have, Options const& ops)
{
    auto wFields = want.fields();
    auto hFields = have.fields();
    releaseAssertOrThrow(wFields.size() == hFields.size());

    std::vector<Notice> res;
    for (size_t i = 0; i < wFields.size(); ++i)
    {
        if (!wFields[i].value.isValid())
        {
            continue;
        }
        Options fOps = ops;
        fOps.trail = fieldTrail(ops.trail, wFields[i].name);
        append(res, deepEqual(wFields[i].value, hFields[i].value, fOps));
    }
    return res;
}

std::vector<Notice>
compareSequences(Value const& want, Value const& have, Options const& ops)
{
    if (want.len() != have.len())
    {
        return lengthError(want, have, ops);
    }
    if (want.kind() == Kind::SLICE && want.storage() == have.storage())
    {
        ops.logTrail();
        return {};
    }

    std::vector<Notice> res;
    for (size_t i = 0; i < want.len(); ++i)
    {
        Options iOps = ops;
        iOps.trail = indexTrail(ops.trail, i);
        append(res, deepEqual(want.index(i), have.index(i), iOps));
    }
    return res;
}

std::vector<Notice>
compareMaps(Value const& want, Value const& have, Options const& ops)
{
    if (want.len() != have.len())
    {
        return lengthError(want, have, ops);
    }
    if (want.storage() == have.storage())
    {
        ops.logTrail();
        return {};
    }

    std::vector<Notice> res;
    for (auto const& key : ops.dumper.sortedKeys(want))
    {
        Options kOps = ops;
        kOps.trail = keyTrail(ops.trail, key.first);
        auto hVal = have.lookup(key.second);
        if (!hVal.isValid())
        {
            kOps.logTrail();
            res.push_back(equalError(have, Value(), kOps));
            continue;
        }
        append(res, deepEqual(want.lookup(key.second), hVal, kOps));
    }
    return res;
}
}

std::vector<Notice>
deepEqual(Value const& want, Value const& have, Options ops)
{
    if (ops.isSkipped())
    {
        ops.logTrail(true);
        return {};
    }

    if (!want.isValid() && !have.isValid())
    {
        ops.logTrail();
        return {};
    }

    if (!want.isValid() || !have.isValid())
    {
        ops.logTrail();
        return {equalError(want, have, ops)};
    }

    if (!want.isAccessible() || !have.isAccessible())
    {
        ops.logTrail(true);
        if (ops.skipUnexported)
        {
            return {};
        }
        Notice n("cannot compare values");
        n.setTrail(ops.trail)
            .append("cause", "value cannot be accessed")
            .append("hint", "use skipTrail or skipUnexportedFields option to "
                            "skip this field");
        return {n};
    }

    if (want.typeId() != have.typeId())
    {
        ops.logTrail();
        return {equalError(want, have, ops)};
    }

    auto trailIt = ops.trailCheckers.find(ops.trail);
    if (trailIt != ops.trailCheckers.end())
    {
        ops.logTrail();
        return fromChecker(trailIt->second, want, have, ops);
    }

    auto typeIt = ops.typeCheckers.find(want.typeId());
    if (typeIt != ops.typeCheckers.end())
    {
        ops.logTrail();
        return fromChecker(typeIt->second, want, have, ops);
    }

    switch (want.kind())
    {
    case Kind::POINTER:
    {
        bool wNil = want.isNil();
        bool hNil = have.isNil();
        if (wNil || hNil)
        {
            return leaf(wNil && hNil, want, have, ops);
        }
        return deepEqual(want.elem(), have.elem(), ops);
    }
    case Kind::RECORD:
        return compareRecords(want, have, ops);
    case Kind::ARRAY:
    case Kind::SLICE:
        return compareSequences(want, have, ops);
    case Kind::MAP:
        return compareMaps(want, have, ops);
    case Kind::INTERFACE:
        return deepEqual(want.elem(), have.elem(), ops);
    case Kind::BOOL:
        return leaf(want.boolValue() == have.boolValue(), want, have, ops);
    case Kind::INT:
        return leaf(want.intValue() == have.intValue(), want, have, ops);
    case Kind::UINT:
        return leaf(want.uintValue() == have.uintValue(), want, have, ops);
    case Kind::FLOAT:
        return leaf(want.floatValue() == have.floatValue(), want, have, ops);
    case Kind::COMPLEX:
        return leaf(want.complexValue() == have.complexValue(), want, have,
                    ops);
    case Kind::STRING:
        return leaf(want.isNil() == have.isNil() &&
                        want.stringValue() == have.stringValue(),
                    want, have, ops);
    case Kind::FUNC:
    case Kind::CHAN:
        return leaf(want.address() == have.address(), want, have, ops);
    case Kind::OTHER:
    case Kind::INVALID:
        break;
    }
    return leaf(want.equals(have), want, have, ops);
}

Notice
equalError(Value const& want, Value const& have, Options const& ops)
{
    auto dmp = ops.dumper;
    auto byteType = adapterOf<unsigned char>().id();
    if (!dmp.hasDumper(byteType))
    {
        dmp.setDumper(byteType, dumpByte);
    }

    Notice n("expected values to be equal");
    n.setTrail(ops.trail).want(dmp.any(want)).have(dmp.any(have));

    auto wType = want.typeName();
    auto hType = have.typeName();
    if (wType != hType || want.typeId() != have.typeId())
    {
        n.append("want type", "{}", wType).append("have type", "{}", hType);
    }
    return n;
}

std::string
dumpByte(dump::Dump const& dmp, int lvl, Value const& val)
{
    auto v = val.as<unsigned char>();
    std::string str;
    if (isPrintableChar(v))
    {
        str = fmt::format("0x{:02x} ('{}')", static_cast<unsigned>(v),
                          static_cast<char>(v));
    }
    else
    {
        str = fmt::format("0x{:02x}", static_cast<unsigned>(v));
    }
    return dump::Printer(dmp).tab(dmp.indent() + lvl).write(str).str();
}

std::optional<notice::Error>
equalValues(Value const& want, Value const& have,
            std::vector<Option> const& opts)
{
    auto ops = defaultOptions(opts);
    return notice::join(deepEqual(want, have, ops));
}

std::optional<notice::Error>
notEqualValues(Value const& want, Value const& have,
               std::vector<Option> const& opts)
{
    if (equalValues(want, have, opts))
    {
        return std::nullopt;
    }
    auto ops = defaultOptions(opts);
    auto n = equalError(want, have, ops);
    n.setHeader("expected values not to be equal");
    return notice::Error(std::move(n));
}
}
}
