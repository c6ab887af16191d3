#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "reflect/Value.h"
#include "util/GlobalChecks.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace deepcheck
{

// Opt-in reflection for user records. A specialization lists the fields in
// declaration order:
//
//   template <> struct RecordTraits<Point>
//   {
//       static constexpr bool valid = true;
//       static constexpr char const* name = "Point";
//       static void
//       fields(FieldList& f, Point const& p)
//       {
//           f("X", p.X);
//           f("Y", p.Y);
//           f.hidden<int>("mCache");
//       }
//   };
template <typename T> struct RecordTraits
{
    static constexpr bool valid = false;
};

// Opt-in reflection for channel-like handles. Values are compared by
// identity only, specializations provide name() and address(T const&).
template <typename T> struct ChanTraits
{
    static constexpr bool valid = false;
};

// Maps a static type to its TypeAdapter (Reflect<T>::Adapter) and its display
// name (Reflect<T>::name()).
template <typename T, typename Enable = void> struct Reflect;

template <typename T>
TypeAdapter const&
adapterOf()
{
    static typename Reflect<T>::Adapter adapter;
    return adapter;
}

template <typename T>
std::string
nameOf()
{
    if constexpr (std::is_void_v<T>)
    {
        return "void";
    }
    else
    {
        return Reflect<T>::name();
    }
}

template <typename T>
std::string
qualifiedNameOf()
{
    using Bare = std::remove_reference_t<T>;
    std::string res = nameOf<std::remove_cv_t<Bare>>();
    if (std::is_const_v<Bare>)
    {
        res += " const";
    }
    if (std::is_lvalue_reference_v<T>)
    {
        res += "&";
    }
    else if (std::is_rvalue_reference_v<T>)
    {
        res += "&&";
    }
    return res;
}

namespace detail
{

template <typename... Ts>
std::string
joinNames()
{
    std::string res;
    ((res += (res.empty() ? "" : ", ") + qualifiedNameOf<Ts>()), ...);
    return res;
}

template <typename T>
char const*
builtinName()
{
    if constexpr (std::is_same_v<T, char>)
        return "char";
    else if constexpr (std::is_same_v<T, signed char>)
        return "signed char";
    else if constexpr (std::is_same_v<T, unsigned char>)
        return "unsigned char";
    else if constexpr (std::is_same_v<T, wchar_t>)
        return "wchar_t";
    else if constexpr (std::is_same_v<T, char16_t>)
        return "char16_t";
    else if constexpr (std::is_same_v<T, char32_t>)
        return "char32_t";
    else if constexpr (std::is_same_v<T, short>)
        return "short";
    else if constexpr (std::is_same_v<T, unsigned short>)
        return "unsigned short";
    else if constexpr (std::is_same_v<T, int>)
        return "int";
    else if constexpr (std::is_same_v<T, unsigned int>)
        return "unsigned int";
    else if constexpr (std::is_same_v<T, long>)
        return "long";
    else if constexpr (std::is_same_v<T, unsigned long>)
        return "unsigned long";
    else if constexpr (std::is_same_v<T, long long>)
        return "long long";
    else if constexpr (std::is_same_v<T, unsigned long long>)
        return "unsigned long long";
    else if constexpr (std::is_same_v<T, float>)
        return "float";
    else if constexpr (std::is_same_v<T, double>)
        return "double";
    else if constexpr (std::is_same_v<T, long double>)
        return "long double";
    else
        return "<arithmetic>";
}

template <typename R, typename P>
std::string
durationName()
{
    using D = std::chrono::duration<R, P>;
    if constexpr (std::is_same_v<D, std::chrono::nanoseconds>)
        return "std::chrono::nanoseconds";
    else if constexpr (std::is_same_v<D, std::chrono::microseconds>)
        return "std::chrono::microseconds";
    else if constexpr (std::is_same_v<D, std::chrono::milliseconds>)
        return "std::chrono::milliseconds";
    else if constexpr (std::is_same_v<D, std::chrono::seconds>)
        return "std::chrono::seconds";
    else if constexpr (std::is_same_v<D, std::chrono::minutes>)
        return "std::chrono::minutes";
    else if constexpr (std::is_same_v<D, std::chrono::hours>)
        return "std::chrono::hours";
    else
        return fmt::format("std::chrono::duration<{}, std::ratio<{}, {}>>",
                           nameOf<R>(), P::num, P::den);
}

template <typename T>
T const*
rawPointer(T* p)
{
    return p;
}

template <typename T>
T const*
rawPointer(std::shared_ptr<T> const& p)
{
    return p.get();
}

template <typename T, typename D>
T const*
rawPointer(std::unique_ptr<T, D> const& p)
{
    return p.get();
}

template <typename T>
T const*
rawPointer(std::optional<T> const& p)
{
    return p ? &*p : nullptr;
}

template <typename R, typename... A>
uintptr_t
funcAddress(R (*f)(A...), void const*)
{
    return reinterpret_cast<uintptr_t>(f);
}

// Plain function targets are identified by the function; anything else by
// the std::function object itself.
template <typename R, typename... A>
uintptr_t
funcAddress(std::function<R(A...)> const& f, void const* self)
{
    if (!f)
    {
        return 0;
    }
    if (auto target = f.template target<R (*)(A...)>())
    {
        return reinterpret_cast<uintptr_t>(*target);
    }
    return reinterpret_cast<uintptr_t>(self);
}

template <typename C, typename = void> struct HasData : std::false_type
{
};

template <typename C>
struct HasData<C, std::void_t<decltype(std::declval<C const&>().data())>>
    : std::true_type
{
};
}

template <typename T, Kind K> class AdapterBase : public TypeAdapter
{
    std::string const mName;

  protected:
    static T const&
    get(void const* p)
    {
        return *static_cast<T const*>(p);
    }

  public:
    AdapterBase() : mName(Reflect<T>::name())
    {
    }

    std::type_index
    id() const override
    {
        return std::type_index(typeid(T));
    }

    std::string const&
    name() const override
    {
        return mName;
    }

    Kind
    kind() const override
    {
        return K;
    }
};

template <typename T> class BoolAdapter : public AdapterBase<T, Kind::BOOL>
{
  public:
    bool
    boolValue(void const* p) const override
    {
        return this->get(p);
    }
};

template <typename T> class IntAdapter : public AdapterBase<T, Kind::INT>
{
  public:
    int64_t
    intValue(void const* p) const override
    {
        return static_cast<int64_t>(this->get(p));
    }
};

template <typename T> class UintAdapter : public AdapterBase<T, Kind::UINT>
{
  public:
    uint64_t
    uintValue(void const* p) const override
    {
        return static_cast<uint64_t>(this->get(p));
    }
};

template <typename T> class FloatAdapter : public AdapterBase<T, Kind::FLOAT>
{
  public:
    long double
    floatValue(void const* p) const override
    {
        return static_cast<long double>(this->get(p));
    }
};

template <typename T>
class ComplexAdapter : public AdapterBase<T, Kind::COMPLEX>
{
  public:
    std::complex<double>
    complexValue(void const* p) const override
    {
        auto const& c = this->get(p);
        return std::complex<double>(static_cast<double>(c.real()),
                                    static_cast<double>(c.imag()));
    }
};

// std::string, std::string_view and C strings. All C string forms share the
// identity of `char const*`.
template <typename T> class StringAdapter : public AdapterBase<T, Kind::STRING>
{
  public:
    std::type_index
    id() const override
    {
        if constexpr (std::is_pointer_v<T> || std::is_array_v<T>)
        {
            return std::type_index(typeid(char const*));
        }
        else
        {
            return AdapterBase<T, Kind::STRING>::id();
        }
    }

    // A null C string is nil, never the empty string.
    bool
    isNil(void const* p) const override
    {
        if constexpr (std::is_pointer_v<T>)
        {
            return this->get(p) == nullptr;
        }
        else
        {
            return false;
        }
    }

    size_t
    len(void const* p) const override
    {
        return stringValue(p).size();
    }

    std::string_view
    stringValue(void const* p) const override
    {
        auto const& s = this->get(p);
        if constexpr (std::is_pointer_v<T>)
        {
            return s ? std::string_view(s) : std::string_view();
        }
        else if constexpr (std::is_array_v<T>)
        {
            auto end = std::find(s, s + std::extent_v<T>, '\0');
            return std::string_view(s, static_cast<size_t>(end - s));
        }
        else
        {
            return std::string_view(s);
        }
    }
};

// Raw and smart pointers, std::optional.
template <typename P> class PointerAdapter : public AdapterBase<P, Kind::POINTER>
{
  public:
    bool
    isNil(void const* p) const override
    {
        return detail::rawPointer(this->get(p)) == nullptr;
    }

    Value
    elem(void const* p) const override
    {
        auto ptr = detail::rawPointer(this->get(p));
        releaseAssertOrThrow(ptr != nullptr);
        return Value::of(*ptr);
    }

    uintptr_t
    address(void const* p) const override
    {
        return reinterpret_cast<uintptr_t>(detail::rawPointer(this->get(p)));
    }
};

template <typename F> class FuncAdapter : public AdapterBase<F, Kind::FUNC>
{
  public:
    bool
    isNil(void const* p) const override
    {
        return address(p) == 0;
    }

    uintptr_t
    address(void const* p) const override
    {
        return detail::funcAddress(this->get(p), p);
    }
};

template <typename C, typename E, Kind K>
class SequenceAdapter : public AdapterBase<C, K>
{
  public:
    size_t
    len(void const* p) const override
    {
        return std::size(this->get(p));
    }

    Value
    index(void const* p, size_t i) const override
    {
        auto const& c = this->get(p);
        releaseAssertOrThrow(i < std::size(c));
        if constexpr (std::is_reference_v<decltype(c[i])>)
        {
            return Value::of(c[i]);
        }
        else
        {
            // std::vector<bool> hands out proxies, not references.
            return Value::owned<E>(c[i]);
        }
    }

    void const*
    storage(void const* p) const override
    {
        if constexpr (detail::HasData<C>::value)
        {
            return static_cast<void const*>(this->get(p).data());
        }
        else
        {
            return p;
        }
    }
};

template <typename M> class MapAdapter : public AdapterBase<M, Kind::MAP>
{
    using Key = typename M::key_type;

  public:
    size_t
    len(void const* p) const override
    {
        return this->get(p).size();
    }

    std::vector<Value>
    keys(void const* p) const override
    {
        auto const& m = this->get(p);
        std::vector<Value> res;
        res.reserve(m.size());
        for (auto const& kv : m)
        {
            res.push_back(Value::of(kv.first));
        }
        return res;
    }

    Value
    lookup(void const* p, Value const& key) const override
    {
        auto const& m = this->get(p);
        auto it = m.find(key.as<Key>());
        if (it == m.end())
        {
            return Value();
        }
        return Value::of(it->second);
    }

    void const*
    storage(void const* p) const override
    {
        return p;
    }
};

// std::variant, unwrapped to its active alternative. Valueless variants and
// std::monostate unwrap to an invalid value.
template <typename V>
class VariantAdapter : public AdapterBase<V, Kind::INTERFACE>
{
  public:
    bool
    isNil(void const* p) const override
    {
        return !elem(p).isValid();
    }

    Value
    elem(void const* p) const override
    {
        auto const& v = this->get(p);
        if (v.valueless_by_exception())
        {
            return Value();
        }
        return std::visit([](auto const& alt) { return Value::of(alt); }, v);
    }
};

// Types compared with their own operator== and rendered with fmt.
template <typename T> class OtherAdapter : public AdapterBase<T, Kind::OTHER>
{
  public:
    bool
    equal(void const* a, void const* b) const override
    {
        return this->get(a) == this->get(b);
    }

    std::string
    render(void const* p) const override
    {
        return fmt::format("{}", this->get(p));
    }
};

template <typename T> class RecordAdapter : public AdapterBase<T, Kind::RECORD>
{
  public:
    void
    fields(void const* p, std::vector<Field>& out) const override
    {
        FieldList list(out);
        RecordTraits<T>::fields(list, this->get(p));
    }
};

template <typename T> class ChanAdapter : public AdapterBase<T, Kind::CHAN>
{
  public:
    bool
    isNil(void const* p) const override
    {
        return address(p) == 0;
    }

    uintptr_t
    address(void const* p) const override
    {
        return reinterpret_cast<uintptr_t>(
            ChanTraits<T>::address(this->get(p)));
    }
};

// Records and channel-like handles declared through their traits.
template <typename T, typename Enable> struct Reflect
{
    static_assert(RecordTraits<T>::valid || ChanTraits<T>::valid,
                  "type is not reflectable: specialize RecordTraits, "
                  "ChanTraits or Reflect");

    using Adapter = std::conditional_t<RecordTraits<T>::valid, RecordAdapter<T>,
                                       ChanAdapter<T>>;

    static std::string
    name()
    {
        if constexpr (RecordTraits<T>::valid)
        {
            return RecordTraits<T>::name;
        }
        else
        {
            return ChanTraits<T>::name();
        }
    }
};

template <> struct Reflect<bool>
{
    using Adapter = BoolAdapter<bool>;
    static std::string
    name()
    {
        return "bool";
    }
};

template <typename T>
struct Reflect<T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>>>
{
    using Adapter = IntAdapter<T>;
    static std::string
    name()
    {
        return detail::builtinName<T>();
    }
};

template <typename T>
struct Reflect<T, std::enable_if_t<std::is_integral_v<T> &&
                                   std::is_unsigned_v<T> &&
                                   !std::is_same_v<T, bool>>>
{
    using Adapter = UintAdapter<T>;
    static std::string
    name()
    {
        return detail::builtinName<T>();
    }
};

template <typename T>
struct Reflect<T, std::enable_if_t<std::is_floating_point_v<T>>>
{
    using Adapter = FloatAdapter<T>;
    static std::string
    name()
    {
        return detail::builtinName<T>();
    }
};

template <typename T> struct Reflect<std::complex<T>>
{
    using Adapter = ComplexAdapter<std::complex<T>>;
    static std::string
    name()
    {
        return "std::complex<" + nameOf<T>() + ">";
    }
};

template <> struct Reflect<std::string>
{
    using Adapter = StringAdapter<std::string>;
    static std::string
    name()
    {
        return "std::string";
    }
};

template <> struct Reflect<std::string_view>
{
    using Adapter = StringAdapter<std::string_view>;
    static std::string
    name()
    {
        return "std::string_view";
    }
};

template <> struct Reflect<char const*>
{
    using Adapter = StringAdapter<char const*>;
    static std::string
    name()
    {
        return "char const*";
    }
};

template <> struct Reflect<char*>
{
    using Adapter = StringAdapter<char*>;
    static std::string
    name()
    {
        return "char const*";
    }
};

template <size_t N> struct Reflect<char[N]>
{
    using Adapter = StringAdapter<char[N]>;
    static std::string
    name()
    {
        return "char const*";
    }
};

template <typename T> struct Reflect<T*>
{
    using Adapter = PointerAdapter<T*>;
    static std::string
    name()
    {
        return qualifiedNameOf<T>() + "*";
    }
};

template <typename T> struct Reflect<std::shared_ptr<T>>
{
    using Adapter = PointerAdapter<std::shared_ptr<T>>;
    static std::string
    name()
    {
        return "std::shared_ptr<" + qualifiedNameOf<T>() + ">";
    }
};

template <typename T, typename D> struct Reflect<std::unique_ptr<T, D>>
{
    using Adapter = PointerAdapter<std::unique_ptr<T, D>>;
    static std::string
    name()
    {
        return "std::unique_ptr<" + qualifiedNameOf<T>() + ">";
    }
};

template <typename T> struct Reflect<std::optional<T>>
{
    using Adapter = PointerAdapter<std::optional<T>>;
    static std::string
    name()
    {
        return "std::optional<" + nameOf<T>() + ">";
    }
};

template <typename R, typename... A> struct Reflect<R (*)(A...)>
{
    using Adapter = FuncAdapter<R (*)(A...)>;
    static std::string
    name()
    {
        return qualifiedNameOf<R>() + "(*)(" + detail::joinNames<A...>() + ")";
    }
};

template <typename R, typename... A> struct Reflect<std::function<R(A...)>>
{
    using Adapter = FuncAdapter<std::function<R(A...)>>;
    static std::string
    name()
    {
        return "std::function<" + qualifiedNameOf<R>() + "(" +
               detail::joinNames<A...>() + ")>";
    }
};

template <typename E, typename A> struct Reflect<std::vector<E, A>>
{
    using Adapter = SequenceAdapter<std::vector<E, A>, E, Kind::SLICE>;
    static std::string
    name()
    {
        return "std::vector<" + nameOf<E>() + ">";
    }
};

template <typename E, size_t N> struct Reflect<std::array<E, N>>
{
    using Adapter = SequenceAdapter<std::array<E, N>, E, Kind::ARRAY>;
    static std::string
    name()
    {
        return fmt::format("std::array<{}, {}>", nameOf<E>(), N);
    }
};

template <typename E, size_t N> struct Reflect<E[N]>
{
    using Adapter = SequenceAdapter<E[N], E, Kind::ARRAY>;
    static std::string
    name()
    {
        return fmt::format("{}[{}]", nameOf<E>(), N);
    }
};

template <typename K, typename V, typename C, typename A>
struct Reflect<std::map<K, V, C, A>>
{
    using Adapter = MapAdapter<std::map<K, V, C, A>>;
    static std::string
    name()
    {
        return "std::map<" + nameOf<K>() + ", " + nameOf<V>() + ">";
    }
};

template <typename K, typename V, typename H, typename E, typename A>
struct Reflect<std::unordered_map<K, V, H, E, A>>
{
    using Adapter = MapAdapter<std::unordered_map<K, V, H, E, A>>;
    static std::string
    name()
    {
        return "std::unordered_map<" + nameOf<K>() + ", " + nameOf<V>() + ">";
    }
};

template <> struct Reflect<std::monostate>
{
    static std::string
    name()
    {
        return "std::monostate";
    }
};

template <typename... Ts> struct Reflect<std::variant<Ts...>>
{
    using Adapter = VariantAdapter<std::variant<Ts...>>;
    static std::string
    name()
    {
        return "std::variant<" + detail::joinNames<Ts...>() + ">";
    }
};

template <typename R, typename P> struct Reflect<std::chrono::duration<R, P>>
{
    using Adapter = OtherAdapter<std::chrono::duration<R, P>>;
    static std::string
    name()
    {
        return detail::durationName<R, P>();
    }
};

template <typename D>
struct Reflect<std::chrono::time_point<std::chrono::system_clock, D>>
{
    using Adapter =
        OtherAdapter<std::chrono::time_point<std::chrono::system_clock, D>>;
    static std::string
    name()
    {
        if constexpr (std::is_same_v<D, std::chrono::system_clock::duration>)
        {
            return "std::chrono::system_clock::time_point";
        }
        else
        {
            return "std::chrono::time_point<std::chrono::system_clock, " +
                   nameOf<D>() + ">";
        }
    }
};
}
