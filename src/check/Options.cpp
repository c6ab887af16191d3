// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "check/Options.h"
#include "util/Logging.h"
#include "util/types.h"
#include <algorithm>
#include <charconv>
#include <cstdlib>

namespace deepcheck
{
namespace check
{

namespace
{
char const* const kEnvName = "DEEPCHECK_OPTIONS";

bool
parseCount(std::string const& str, int& out)
{
    auto first = str.data();
    auto last = str.data() + str.size();
    auto res = std::from_chars(first, last, out);
    return res.ec == std::errc() && res.ptr == last && out >= 0;
}
}

bool
Options::isSkipped() const
{
    return std::find(skipTrails.begin(), skipTrails.end(), trail) !=
           skipTrails.end();
}

void
Options::logTrail(bool skipped) const
{
    if (trail.empty())
    {
        return;
    }
    auto entry = skipped ? trail + " <skipped>" : trail;
    CLOG_TRACE(Check, "Visiting {}", entry);
    if (trailLog)
    {
        trailLog->push_back(std::move(entry));
    }
}

Options
defaultOptions(std::vector<Option> const& opts)
{
    Options ops;
    for (auto const& opt : envOptions())
    {
        opt(ops);
    }
    for (auto const& opt : opts)
    {
        opt(ops);
    }
    return ops;
}

std::vector<Option>
parseOptions(std::string const& tokens)
{
    std::vector<Option> res;
    for (auto const& token : splitAndTrim(tokens, ','))
    {
        auto eq = token.find('=');
        auto name = trim(token.substr(0, eq));
        auto arg = eq == std::string::npos ? std::string()
                                           : trim(token.substr(eq + 1));
        bool hasArg = eq != std::string::npos;
        int count = 0;

        if (!hasArg && iequals(name, "skip_unexported"))
        {
            res.emplace_back(skipUnexportedFields());
        }
        else if (!hasArg && iequals(name, "flat"))
        {
            res.emplace_back(flat());
        }
        else if (!hasArg && iequals(name, "show_addresses"))
        {
            res.emplace_back(showAddresses());
        }
        else if (hasArg && iequals(name, "indent") && parseCount(arg, count))
        {
            res.emplace_back(indent(count));
        }
        else if (hasArg && iequals(name, "flatten_strings") &&
                 parseCount(arg, count))
        {
            res.emplace_back(flattenStrings(static_cast<size_t>(count)));
        }
        else if (hasArg && iequals(name, "tab_width") && parseCount(arg, count))
        {
            res.emplace_back([count](Options& ops) {
                ops.dumper.setTabWidth(count);
            });
        }
        else
        {
            CLOG_WARNING(Check, "Ignoring unknown {} entry: '{}'", kEnvName,
                         token);
        }
    }
    return res;
}

std::vector<Option>
envOptions()
{
    char const* env = std::getenv(kEnvName);
    if (!env)
    {
        return {};
    }
    CLOG_DEBUG(Check, "Applying {}='{}'", kEnvName, env);
    return parseOptions(env);
}

Option
skipTrail(std::string trail)
{
    return [trail = std::move(trail)](Options& ops) {
        ops.skipTrails.push_back(trail);
    };
}

Option
skipUnexportedFields()
{
    return [](Options& ops) { ops.skipUnexported = true; };
}

Option
trailChecker(std::string trail, Checker checker)
{
    return [trail = std::move(trail),
            checker = std::move(checker)](Options& ops) {
        ops.trailCheckers[trail] = checker;
    };
}

Option
typeChecker(std::type_index type, Checker checker)
{
    return [type, checker = std::move(checker)](Options& ops) {
        ops.typeCheckers[type] = checker;
    };
}

Option
withTrail(std::string trail)
{
    return [trail = std::move(trail)](Options& ops) { ops.trail = trail; };
}

Option
withTrailLog(std::vector<std::string>& log)
{
    return [&log](Options& ops) { ops.trailLog = &log; };
}

Option
withDump(std::vector<dump::DumpOption> opts)
{
    return [opts = std::move(opts)](Options& ops) {
        for (auto const& opt : opts)
        {
            opt(ops.dumper);
        }
    };
}

Option
withOptions(Options const& src)
{
    return [src](Options& ops) { ops = src; };
}

Option
showAddresses()
{
    return [](Options& ops) { ops.dumper.setPtrAddr(true); };
}

Option
indent(int indent)
{
    return [indent](Options& ops) { ops.dumper.setIndent(indent); };
}

Option
flattenStrings(size_t length)
{
    return [length](Options& ops) { ops.dumper.setFlatStrings(length); };
}

Option
flat()
{
    return [](Options& ops) { ops.dumper.setFlat(true); };
}

Option
dumper(std::type_index type, dump::Dumper fn)
{
    return [type, fn = std::move(fn)](Options& ops) {
        ops.dumper.setDumper(type, fn);
    };
}
}
}
