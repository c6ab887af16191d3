#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "check/Options.h"
#include "dump/Dump.h"
#include "notice/Notice.h"
#include "reflect/Reflect.h"
#include <optional>
#include <string>
#include <vector>

namespace deepcheck
{
namespace check
{

// Recursively compares `want` and `have`. Returns nullopt when they are equal
// or an error listing every mismatch, in field, index and sorted key order.
std::optional<notice::Error> equalValues(Value const& want, Value const& have,
                                         std::vector<Option> const& opts = {});

// Returns nullopt when equalValues reports a mismatch and an "expected values
// not to be equal" error otherwise.
std::optional<notice::Error>
notEqualValues(Value const& want, Value const& have,
               std::vector<Option> const& opts = {});

// Comparison at the trail held by `ops`. Used by custom checkers that want to
// fall back to the default rules for parts of their values.
std::vector<notice::Notice> deepEqual(Value const& want, Value const& have,
                                      Options ops);

// Notice for `want` and `have` at the trail held by `ops`. Carries type rows
// when the types differ.
notice::Notice equalError(Value const& want, Value const& have,
                          Options const& ops);

// Renders unsigned char as `0x41 ('A')`, or `0x00` when not printable.
std::string dumpByte(dump::Dump const& dmp, int lvl, Value const& val);

// Front-ends taking any reflectable values followed by any number of Option
// values. The names stay clear of std::equal, which argument-dependent lookup
// would otherwise pick up for arguments from namespace std.
template <typename W, typename H, typename... Opts>
std::optional<notice::Error>
expectEqual(W const& want, H const& have, Opts&&... opts)
{
    return equalValues(Value::of(want), Value::of(have),
                       std::vector<Option>{Option(std::forward<Opts>(opts))...});
}

template <typename W, typename H, typename... Opts>
std::optional<notice::Error>
expectNotEqual(W const& want, H const& have, Opts&&... opts)
{
    return notEqualValues(
        Value::of(want), Value::of(have),
        std::vector<Option>{Option(std::forward<Opts>(opts))...});
}
}
}
