#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "reflect/Kind.h"
#include <complex>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <variant>
#include <vector>

namespace deepcheck
{

class Value;
struct Field;

// Describes one static type: its identity, display name, kind and the
// kind-specific accessors. Accessors receive a pointer to an object of the
// described type. The defaults throw std::logic_error, so an adapter only
// overrides what makes sense for its kind.
class TypeAdapter
{
  public:
    virtual ~TypeAdapter() = default;

    virtual std::type_index id() const = 0;
    virtual std::string const& name() const = 0;
    virtual Kind kind() const = 0;

    virtual bool isNil(void const* p) const;
    virtual size_t len(void const* p) const;
    virtual Value index(void const* p, size_t i) const;
    virtual Value elem(void const* p) const;
    virtual void fields(void const* p, std::vector<Field>& out) const;
    virtual std::vector<Value> keys(void const* p) const;
    virtual Value lookup(void const* p, Value const& key) const;

    virtual bool boolValue(void const* p) const;
    virtual int64_t intValue(void const* p) const;
    virtual uint64_t uintValue(void const* p) const;
    virtual long double floatValue(void const* p) const;
    virtual std::complex<double> complexValue(void const* p) const;
    virtual std::string_view stringValue(void const* p) const;

    // Identity of reference-like values (pointers, functions, channels).
    virtual uintptr_t address(void const* p) const;
    // Identity of the storage backing a slice or a map.
    virtual void const* storage(void const* p) const;

    virtual bool equal(void const* a, void const* b) const;
    virtual std::string render(void const* p) const;

  protected:
    [[noreturn]] void unsupported(char const* operation) const;
};

template <typename T> TypeAdapter const& adapterOf();

// Borrowed, type-erased handle to a value. A default constructed Value is
// invalid (absent). The referenced object must outlive the handle unless the
// handle owns a copy (see owned()).
class Value
{
    TypeAdapter const* mType{nullptr};
    void const* mPtr{nullptr};
    std::shared_ptr<void const> mOwner;
    bool mAccessible{true};

    Value(TypeAdapter const& type, void const* ptr,
          std::shared_ptr<void const> owner, bool accessible);

    [[noreturn]] void throwBadCast(std::string const& wanted) const;
    void const* checkedData(char const* operation) const;

  public:
    Value() = default;

    template <typename T> static Value of(T const& v);

    // For values that have no addressable storage, e.g. the elements of
    // std::vector<bool>.
    template <typename T> static Value owned(T v);

    // A value of type T that can never be introspected.
    template <typename T> static Value inaccessible();

    bool
    isValid() const
    {
        return mType != nullptr;
    }

    bool
    isAccessible() const
    {
        return mAccessible;
    }

    Kind kind() const;
    TypeAdapter const& type() const;
    std::type_index typeId() const;
    std::string typeName() const;
    void const* data() const;

    bool isNil() const;
    size_t len() const;
    Value index(size_t i) const;
    Value elem() const;
    std::vector<Field> fields() const;
    std::vector<Value> keys() const;
    Value lookup(Value const& key) const;

    bool boolValue() const;
    int64_t intValue() const;
    uint64_t uintValue() const;
    long double floatValue() const;
    std::complex<double> complexValue() const;
    std::string_view stringValue() const;

    uintptr_t address() const;
    void const* storage() const;

    // Generic whole-value equality. Both values must have the same type.
    bool equals(Value const& other) const;
    std::string render() const;

    // Returns the underlying object. Throws std::invalid_argument when the
    // value does not hold a T.
    template <typename T> T const& as() const;
};

struct Field
{
    std::string name;
    Value value;
};

// Receives the fields of a record in declaration order, see RecordTraits.
class FieldList
{
    std::vector<Field>& mFields;

  public:
    explicit FieldList(std::vector<Field>& fields) : mFields(fields)
    {
    }

    template <typename F>
    FieldList&
    operator()(std::string name, F const& value)
    {
        mFields.push_back(Field{std::move(name), Value::of(value)});
        return *this;
    }

    // Declares a private field. It is never read, its value is reported as
    // inaccessible.
    template <typename F>
    FieldList&
    hidden(std::string name)
    {
        mFields.push_back(Field{std::move(name), Value::inaccessible<F>()});
        return *this;
    }
};

template <typename T>
Value
Value::of(T const& v)
{
    if constexpr (std::is_same_v<T, Value>)
    {
        return v;
    }
    else if constexpr (std::is_same_v<T, std::nullptr_t> ||
                       std::is_same_v<T, std::monostate>)
    {
        return Value();
    }
    else
    {
        return Value(adapterOf<T>(), std::addressof(v), nullptr, true);
    }
}

template <typename T>
Value
Value::owned(T v)
{
    auto owner = std::make_shared<T>(std::move(v));
    void const* ptr = owner.get();
    return Value(adapterOf<T>(), ptr, std::move(owner), true);
}

template <typename T>
Value
Value::inaccessible()
{
    return Value(adapterOf<T>(), nullptr, nullptr, false);
}

template <typename T>
T const&
Value::as() const
{
    if (mType != &adapterOf<T>() || !mAccessible)
    {
        throwBadCast(adapterOf<T>().name());
    }
    return *static_cast<T const*>(mPtr);
}
}
