// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "reflect/Reflect.h"
#include "test/Catch2.h"
#include "test/TestTypes.h"

#include <chrono>
#include <functional>
#include <stdexcept>
#include <unordered_map>

namespace deepcheck
{

using namespace testtypes;

TEST_CASE("default value is invalid", "[reflect]")
{
    Value v;
    REQUIRE_FALSE(v.isValid());
    REQUIRE(v.kind() == Kind::INVALID);
    REQUIRE(v.typeName() == "std::nullptr_t");
    REQUIRE_THROWS_AS(v.len(), std::logic_error);
    REQUIRE_FALSE(Value::of(nullptr).isValid());
}

TEST_CASE("scalar kinds and names", "[reflect]")
{
    bool b = true;
    int i = -3;
    unsigned char uc = 7;
    unsigned long ul = 9;
    double d = 1.5;
    float f = 0.25f;
    std::complex<double> c(1, -2);

    REQUIRE(Value::of(b).kind() == Kind::BOOL);
    REQUIRE(Value::of(b).boolValue());
    REQUIRE(Value::of(i).kind() == Kind::INT);
    REQUIRE(Value::of(i).intValue() == -3);
    REQUIRE(Value::of(i).typeName() == "int");
    REQUIRE(Value::of(uc).kind() == Kind::UINT);
    REQUIRE(Value::of(uc).typeName() == "unsigned char");
    REQUIRE(Value::of(ul).uintValue() == 9);
    REQUIRE(Value::of(ul).typeName() == "unsigned long");
    REQUIRE(Value::of(d).kind() == Kind::FLOAT);
    REQUIRE(Value::of(d).floatValue() == 1.5);
    REQUIRE(Value::of(f).typeName() == "float");
    REQUIRE(Value::of(c).kind() == Kind::COMPLEX);
    REQUIRE(Value::of(c).complexValue() == std::complex<double>(1, -2));
}

TEST_CASE("string forms", "[reflect]")
{
    std::string s = "abc";
    std::string_view sv = "xy";
    char const* cs = "hello";
    char const* nullCs = nullptr;

    REQUIRE(Value::of(s).kind() == Kind::STRING);
    REQUIRE(Value::of(s).stringValue() == "abc");
    REQUIRE(Value::of(s).len() == 3);
    REQUIRE(Value::of(sv).typeName() == "std::string_view");
    REQUIRE(Value::of(cs).stringValue() == "hello");
    REQUIRE(Value::of(nullCs).stringValue().empty());
    REQUIRE(Value::of(nullCs).isNil());
    REQUIRE_FALSE(Value::of(cs).isNil());
    REQUIRE_FALSE(Value::of(s).isNil());

    SECTION("C strings share one identity")
    {
        auto literal = Value::of("hello");
        REQUIRE(literal.kind() == Kind::STRING);
        REQUIRE(literal.typeName() == "char const*");
        REQUIRE(literal.typeId() == Value::of(cs).typeId());
        REQUIRE(literal.stringValue() == "hello");
    }
}

TEST_CASE("pointer like values", "[reflect]")
{
    int x = 5;
    int* p = &x;
    int* np = nullptr;
    auto sp = std::make_shared<int>(6);
    std::unique_ptr<int> up;
    std::optional<int> opt = 7;

    REQUIRE(Value::of(p).kind() == Kind::POINTER);
    REQUIRE(Value::of(p).typeName() == "int*");
    REQUIRE_FALSE(Value::of(p).isNil());
    REQUIRE(Value::of(p).elem().intValue() == 5);
    REQUIRE(Value::of(p).address() == reinterpret_cast<uintptr_t>(&x));
    REQUIRE(Value::of(np).isNil());
    REQUIRE(Value::of(np).address() == 0);
    REQUIRE(Value::of(sp).elem().intValue() == 6);
    REQUIRE(Value::of(sp).typeName() == "std::shared_ptr<int>");
    REQUIRE(Value::of(up).isNil());
    REQUIRE(Value::of(opt).elem().intValue() == 7);
    REQUIRE(Value::of(opt).typeName() == "std::optional<int>");

    int const* cp = &x;
    REQUIRE(Value::of(cp).typeName() == "int const*");
}

TEST_CASE("sequences", "[reflect]")
{
    std::vector<int> v{1, 2, 3};
    std::array<int, 2> a{{4, 5}};
    int raw[3] = {6, 7, 8};
    std::vector<bool> bits{true, false};

    auto vv = Value::of(v);
    REQUIRE(vv.kind() == Kind::SLICE);
    REQUIRE(vv.len() == 3);
    REQUIRE(vv.index(2).intValue() == 3);
    REQUIRE(vv.storage() == v.data());
    REQUIRE(vv.typeName() == "std::vector<int>");
    REQUIRE_THROWS(vv.index(3));

    REQUIRE(Value::of(a).kind() == Kind::ARRAY);
    REQUIRE(Value::of(a).typeName() == "std::array<int, 2>");
    REQUIRE(Value::of(a).index(1).intValue() == 5);
    REQUIRE(Value::of(raw).kind() == Kind::ARRAY);
    REQUIRE(Value::of(raw).typeName() == "int[3]");
    REQUIRE(Value::of(raw).index(0).intValue() == 6);

    auto bv = Value::of(bits);
    REQUIRE(bv.len() == 2);
    REQUIRE(bv.index(0).boolValue());
    REQUIRE_FALSE(bv.index(1).boolValue());
}

TEST_CASE("maps", "[reflect]")
{
    std::map<std::string, int> m{{"a", 1}, {"b", 2}};
    std::unordered_map<int, std::string> um{{1, "x"}};

    auto mv = Value::of(m);
    REQUIRE(mv.kind() == Kind::MAP);
    REQUIRE(mv.len() == 2);
    REQUIRE(mv.typeName() == "std::map<std::string, int>");
    REQUIRE(mv.keys().size() == 2);

    std::string key = "b";
    REQUIRE(mv.lookup(Value::of(key)).intValue() == 2);
    std::string missing = "z";
    REQUIRE_FALSE(mv.lookup(Value::of(missing)).isValid());

    int k = 1;
    REQUIRE(Value::of(um).lookup(Value::of(k)).stringValue() == "x");

    SECTION("lookup with a key of another type is a usage error")
    {
        REQUIRE_THROWS_AS(mv.lookup(Value::of(k)), std::invalid_argument);
    }
}

TEST_CASE("variants unwrap to the active alternative", "[reflect]")
{
    std::variant<std::monostate, int, std::string> var;
    auto vv = Value::of(var);
    REQUIRE(vv.kind() == Kind::INTERFACE);
    REQUIRE(vv.isNil());
    REQUIRE_FALSE(vv.elem().isValid());
    REQUIRE(vv.typeName() ==
            "std::variant<std::monostate, int, std::string>");

    var = std::string("on");
    REQUIRE(Value::of(var).elem().stringValue() == "on");
}

namespace
{
int
twice(int x)
{
    return 2 * x;
}
}

TEST_CASE("functions are identified by address", "[reflect]")
{
    int (*fp)(int) = &twice;
    int (*nfp)(int) = nullptr;
    std::function<int(int)> fn = &twice;
    std::function<int(int)> empty;

    REQUIRE(Value::of(fp).kind() == Kind::FUNC);
    REQUIRE(Value::of(fp).typeName() == "int(*)(int)");
    REQUIRE(Value::of(fp).address() == reinterpret_cast<uintptr_t>(&twice));
    REQUIRE(Value::of(nfp).isNil());
    REQUIRE(Value::of(fn).address() == Value::of(fp).address());
    REQUIRE(Value::of(empty).address() == 0);
    REQUIRE(Value::of(fn).typeName() == "std::function<int(int)>");
}

TEST_CASE("records list their fields", "[reflect]")
{
    Point pt{1, 2};
    auto pv = Value::of(pt);
    REQUIRE(pv.kind() == Kind::RECORD);
    REQUIRE(pv.typeName() == "Point");

    auto fields = pv.fields();
    REQUIRE(fields.size() == 2);
    REQUIRE(fields[0].name == "X");
    REQUIRE(fields[0].value.intValue() == 1);
    REQUIRE(fields[1].name == "Y");
    REQUIRE(fields[1].value.intValue() == 2);
}

TEST_CASE("hidden fields are inaccessible", "[reflect]")
{
    Account acc("joe", 10);
    auto fields = Value::of(acc).fields();
    REQUIRE(fields.size() == 2);
    REQUIRE(fields[0].name == "mBalance");
    REQUIRE(fields[0].value.isValid());
    REQUIRE_FALSE(fields[0].value.isAccessible());
    REQUIRE(fields[0].value.typeName() == "int");
    REQUIRE_THROWS_AS(fields[0].value.intValue(), std::logic_error);
    REQUIRE_THROWS_AS(fields[0].value.as<int>(), std::invalid_argument);
    REQUIRE(fields[1].value.stringValue() == "joe");
}

TEST_CASE("channel handles", "[reflect]")
{
    auto ch = IntChan::make();
    IntChan nilCh;
    REQUIRE(Value::of(ch).kind() == Kind::CHAN);
    REQUIRE(Value::of(ch).typeName() == "chan int");
    REQUIRE(Value::of(ch).address() ==
            reinterpret_cast<uintptr_t>(ch.mQueue.get()));
    REQUIRE(Value::of(nilCh).isNil());
}

TEST_CASE("chrono values use their own equality", "[reflect]")
{
    std::chrono::milliseconds a(5);
    std::chrono::milliseconds b(5);
    std::chrono::milliseconds c(6);
    REQUIRE(Value::of(a).kind() == Kind::OTHER);
    REQUIRE(Value::of(a).typeName() == "std::chrono::milliseconds");
    REQUIRE(Value::of(a).equals(Value::of(b)));
    REQUIRE_FALSE(Value::of(a).equals(Value::of(c)));
    REQUIRE(Value::of(a).render() == "5ms");
}

TEST_CASE("typed access", "[reflect]")
{
    int x = 4;
    auto v = Value::of(x);
    REQUIRE(&v.as<int>() == &x);
    REQUIRE_THROWS_AS(v.as<long>(), std::invalid_argument);
    REQUIRE_THROWS_AS(v.stringValue(), std::logic_error);
}
}
