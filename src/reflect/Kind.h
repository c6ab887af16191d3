#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

namespace deepcheck
{

// Structural category of a value. Selects comparison and rendering rules.
enum class Kind
{
    INVALID,
    BOOL,
    INT,
    UINT,
    FLOAT,
    COMPLEX,
    STRING,
    POINTER,
    RECORD,
    ARRAY,
    SLICE,
    MAP,
    INTERFACE,
    FUNC,
    CHAN,
    OTHER
};

char const* kindName(Kind kind);

// ARRAY and SLICE
bool isSequence(Kind kind);
}
