// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "reflect/Value.h"
#include <fmt/format.h>
#include <stdexcept>
#include <typeinfo>

namespace deepcheck
{

void
TypeAdapter::unsupported(char const* operation) const
{
    throw std::logic_error(fmt::format("{} is not supported by {} ({})",
                                       operation, name(), kindName(kind())));
}

bool
TypeAdapter::isNil(void const*) const
{
    return false;
}

size_t
TypeAdapter::len(void const*) const
{
    unsupported("len");
}

Value
TypeAdapter::index(void const*, size_t) const
{
    unsupported("index");
}

Value
TypeAdapter::elem(void const*) const
{
    unsupported("elem");
}

void
TypeAdapter::fields(void const*, std::vector<Field>&) const
{
    unsupported("fields");
}

std::vector<Value>
TypeAdapter::keys(void const*) const
{
    unsupported("keys");
}

Value
TypeAdapter::lookup(void const*, Value const&) const
{
    unsupported("lookup");
}

bool
TypeAdapter::boolValue(void const*) const
{
    unsupported("boolValue");
}

int64_t
TypeAdapter::intValue(void const*) const
{
    unsupported("intValue");
}

uint64_t
TypeAdapter::uintValue(void const*) const
{
    unsupported("uintValue");
}

long double
TypeAdapter::floatValue(void const*) const
{
    unsupported("floatValue");
}

std::complex<double>
TypeAdapter::complexValue(void const*) const
{
    unsupported("complexValue");
}

std::string_view
TypeAdapter::stringValue(void const*) const
{
    unsupported("stringValue");
}

uintptr_t
TypeAdapter::address(void const*) const
{
    unsupported("address");
}

void const*
TypeAdapter::storage(void const*) const
{
    unsupported("storage");
}

bool
TypeAdapter::equal(void const*, void const*) const
{
    unsupported("equal");
}

std::string
TypeAdapter::render(void const*) const
{
    unsupported("render");
}

Value::Value(TypeAdapter const& type, void const* ptr,
             std::shared_ptr<void const> owner, bool accessible)
    : mType(&type), mPtr(ptr), mOwner(std::move(owner)), mAccessible(accessible)
{
}

void
Value::throwBadCast(std::string const& wanted) const
{
    if (!mAccessible)
    {
        throw std::invalid_argument(
            fmt::format("cannot access inaccessible {} value as {}",
                        typeName(), wanted));
    }
    throw std::invalid_argument(
        fmt::format("cannot access {} value as {}", typeName(), wanted));
}

void const*
Value::checkedData(char const* operation) const
{
    if (!mType)
    {
        throw std::logic_error(
            fmt::format("{} called on an invalid value", operation));
    }
    if (!mAccessible)
    {
        throw std::logic_error(fmt::format(
            "{} called on an inaccessible {} value", operation, mType->name()));
    }
    return mPtr;
}

Kind
Value::kind() const
{
    return mType ? mType->kind() : Kind::INVALID;
}

TypeAdapter const&
Value::type() const
{
    if (!mType)
    {
        throw std::logic_error("an invalid value has no type");
    }
    return *mType;
}

std::type_index
Value::typeId() const
{
    return mType ? mType->id() : std::type_index(typeid(std::nullptr_t));
}

std::string
Value::typeName() const
{
    return mType ? mType->name() : std::string("std::nullptr_t");
}

void const*
Value::data() const
{
    return mPtr;
}

bool
Value::isNil() const
{
    auto p = checkedData("isNil");
    return mType->isNil(p);
}

size_t
Value::len() const
{
    auto p = checkedData("len");
    return mType->len(p);
}

Value
Value::index(size_t i) const
{
    auto p = checkedData("index");
    return mType->index(p, i);
}

Value
Value::elem() const
{
    auto p = checkedData("elem");
    return mType->elem(p);
}

std::vector<Field>
Value::fields() const
{
    std::vector<Field> res;
    auto p = checkedData("fields");
    mType->fields(p, res);
    return res;
}

std::vector<Value>
Value::keys() const
{
    auto p = checkedData("keys");
    return mType->keys(p);
}

Value
Value::lookup(Value const& key) const
{
    auto p = checkedData("lookup");
    return mType->lookup(p, key);
}

bool
Value::boolValue() const
{
    auto p = checkedData("boolValue");
    return mType->boolValue(p);
}

int64_t
Value::intValue() const
{
    auto p = checkedData("intValue");
    return mType->intValue(p);
}

uint64_t
Value::uintValue() const
{
    auto p = checkedData("uintValue");
    return mType->uintValue(p);
}

long double
Value::floatValue() const
{
    auto p = checkedData("floatValue");
    return mType->floatValue(p);
}

std::complex<double>
Value::complexValue() const
{
    auto p = checkedData("complexValue");
    return mType->complexValue(p);
}

std::string_view
Value::stringValue() const
{
    auto p = checkedData("stringValue");
    return mType->stringValue(p);
}

uintptr_t
Value::address() const
{
    auto p = checkedData("address");
    return mType->address(p);
}

void const*
Value::storage() const
{
    auto p = checkedData("storage");
    return mType->storage(p);
}

bool
Value::equals(Value const& other) const
{
    auto a = checkedData("equals");
    auto b = other.checkedData("equals");
    if (other.mType->id() != mType->id())
    {
        return false;
    }
    return mType->equal(a, b);
}

std::string
Value::render() const
{
    auto p = checkedData("render");
    return mType->render(p);
}
}
