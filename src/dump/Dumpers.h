#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "dump/Dump.h"
#include <string>

// Kind specific renderers used by Dump::value. Each one expects a value of
// its kind and returns the indented ValErrUsage string otherwise.

namespace deepcheck
{
namespace dump
{

// BOOL, INT, UINT, FLOAT, COMPLEX and STRING values.
std::string simpleDumper(Dump const& dmp, int lvl, Value const& val);

std::string ptrDumper(Dump const& dmp, int lvl, Value const& val);
std::string recordDumper(Dump const& dmp, int lvl, Value const& val);

// ARRAY and SLICE values.
std::string sequenceDumper(Dump const& dmp, int lvl, Value const& val);

// Keys are written in Dump::keyString order.
std::string mapDumper(Dump const& dmp, int lvl, Value const& val);

std::string interfaceDumper(Dump const& dmp, int lvl, Value const& val);
std::string funcDumper(Dump const& dmp, int lvl, Value const& val);
std::string chanDumper(Dump const& dmp, int lvl, Value const& val);
std::string otherDumper(Dump const& dmp, int lvl, Value const& val);
}
}
