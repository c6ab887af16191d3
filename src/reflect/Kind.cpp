// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "reflect/Kind.h"

namespace deepcheck
{

char const*
kindName(Kind kind)
{
    switch (kind)
    {
    case Kind::INVALID:
        return "invalid";
    case Kind::BOOL:
        return "bool";
    case Kind::INT:
        return "int";
    case Kind::UINT:
        return "uint";
    case Kind::FLOAT:
        return "float";
    case Kind::COMPLEX:
        return "complex";
    case Kind::STRING:
        return "string";
    case Kind::POINTER:
        return "pointer";
    case Kind::RECORD:
        return "record";
    case Kind::ARRAY:
        return "array";
    case Kind::SLICE:
        return "slice";
    case Kind::MAP:
        return "map";
    case Kind::INTERFACE:
        return "interface";
    case Kind::FUNC:
        return "func";
    case Kind::CHAN:
        return "chan";
    case Kind::OTHER:
        return "other";
    }
    return "????";
}

bool
isSequence(Kind kind)
{
    return kind == Kind::ARRAY || kind == Kind::SLICE;
}
}
