#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "dump/Dump.h"
#include "notice/Notice.h"
#include "reflect/Reflect.h"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

namespace deepcheck
{
namespace check
{

struct Options;

// Custom comparison for a trail or a type. Returns nullopt when the values
// are equal.
using Checker = std::function<std::optional<notice::Error>(
    Value const& want, Value const& have, Options const& opts)>;

using Option = std::function<void(Options&)>;

// Comparison context. Every recursion level works on its own copy, only the
// trail changes on the way down.
struct Options
{
    // Location of the values being compared.
    std::string trail;

    // Exact trails that are not compared.
    std::vector<std::string> skipTrails;

    // Treat inaccessible values as equal.
    bool skipUnexported{false};

    std::map<std::string, Checker> trailCheckers;
    std::map<std::type_index, Checker> typeCheckers;

    // Renders values in notices.
    dump::Dump dumper;

    // When set, receives every visited trail. Not owned.
    std::vector<std::string>* trailLog{nullptr};

    bool isSkipped() const;

    // Records the current trail in the trail log, with a " <skipped>" suffix
    // when `skipped` is set.
    void logTrail(bool skipped = false) const;
};

// Defaults, then the options from the DEEPCHECK_OPTIONS environment variable,
// then `opts` in order.
Options defaultOptions(std::vector<Option> const& opts = {});

// Parses a comma separated list of option tokens: skip_unexported, flat,
// show_addresses, indent=N, flatten_strings=N and tab_width=N. Unknown or
// malformed tokens are logged and ignored.
std::vector<Option> parseOptions(std::string const& tokens);

// Options listed in the DEEPCHECK_OPTIONS environment variable.
std::vector<Option> envOptions();

Option skipTrail(std::string trail);
Option skipUnexportedFields();
Option trailChecker(std::string trail, Checker checker);
Option typeChecker(std::type_index type, Checker checker);
Option withTrail(std::string trail);
Option withTrailLog(std::vector<std::string>& log);
Option withDump(std::vector<dump::DumpOption> opts);

// Replaces all options with a copy of `ops`.
Option withOptions(Options const& ops);

Option showAddresses();
Option indent(int indent);
Option flattenStrings(size_t length);
Option flat();
Option dumper(std::type_index type, dump::Dumper fn);

template <typename T>
Option
typeChecker(Checker checker)
{
    return typeChecker(adapterOf<T>().id(), std::move(checker));
}

template <typename T>
Option
dumper(dump::Dumper fn)
{
    return dumper(adapterOf<T>().id(), std::move(fn));
}
}
}
