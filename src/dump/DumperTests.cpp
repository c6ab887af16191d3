// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "dump/Dump.h"
#include "dump/Dumpers.h"
#include "test/Catch2.h"
#include "test/TestTypes.h"

#include <fmt/format.h>
#include <unordered_map>

namespace deepcheck
{
namespace dump
{

using namespace testtypes;

TEST_CASE("chan dumper", "[dump]")
{
    SECTION("nil channel")
    {
        Dump dmp({ptrAddr()});
        IntChan ch;
        REQUIRE(chanDumper(dmp, 0, Value::of(ch)) == "(chan int)(<0x0>)");
    }

    SECTION("usage error")
    {
        REQUIRE(chanDumper(Dump(), 0, Value::of(1234)) == ValErrUsage);
    }

    SECTION("usage error uses level")
    {
        REQUIRE(chanDumper(Dump(), 2, Value::of(1234)) ==
                std::string("    ") + ValErrUsage);
    }

    SECTION("print pointer address")
    {
        Dump dmp({ptrAddr()});
        auto ch = IntChan::make();
        auto want = fmt::format("(chan int)(<0x{:x}>)",
                                reinterpret_cast<uintptr_t>(ch.mQueue.get()));
        REQUIRE(chanDumper(dmp, 0, Value::of(ch)) == want);
    }

    SECTION("uses level")
    {
        auto ch = IntChan::make();
        REQUIRE(chanDumper(Dump(), 1, Value::of(ch)) ==
                "  (chan int)(<addr>)");
    }

    SECTION("uses indent and level")
    {
        Dump dmp({indent(2)});
        auto ch = IntChan::make();
        REQUIRE(chanDumper(dmp, 1, Value::of(ch)) ==
                "      (chan int)(<addr>)");
    }

    SECTION("uses tab width")
    {
        Dump dmp({tabWidth(4)});
        auto ch = IntChan::make();
        REQUIRE(chanDumper(dmp, 1, Value::of(ch)) ==
                "    (chan int)(<addr>)");
    }
}

namespace
{
void
noop()
{
}

int
inc(int x)
{
    return x + 1;
}
}

TEST_CASE("func dumper", "[dump]")
{
    SECTION("nil function")
    {
        Dump dmp({ptrAddr()});
        void (*fn)() = nullptr;
        REQUIRE(funcDumper(dmp, 0, Value::of(fn)) == "<func>(<0x0>)");
    }

    SECTION("empty std::function")
    {
        Dump dmp({ptrAddr()});
        std::function<void()> fn;
        REQUIRE(funcDumper(dmp, 0, Value::of(fn)) == "<func>(<0x0>)");
    }

    SECTION("usage error")
    {
        REQUIRE(funcDumper(Dump(), 0, Value::of(1234)) == ValErrUsage);
    }

    SECTION("print pointer address")
    {
        Dump dmp({ptrAddr()});
        void (*fn)() = &noop;
        auto want = fmt::format("<func>(<0x{:x}>)",
                                reinterpret_cast<uintptr_t>(&noop));
        REQUIRE(funcDumper(dmp, 0, Value::of(fn)) == want);
    }

    SECTION("uses indent and level")
    {
        Dump dmp({indent(2)});
        REQUIRE(funcDumper(dmp, 1, Value::of(1234)) ==
                std::string("      ") + ValErrUsage);
    }

    SECTION("address is hidden by default")
    {
        void (*f0)() = &noop;
        int (*f1)(int) = &inc;
        REQUIRE(funcDumper(Dump(), 0, Value::of(f0)) == "<func>(<addr>)");
        REQUIRE(funcDumper(Dump(), 0, Value::of(f1)) == "<func>(<addr>)");
    }
}

TEST_CASE("simple dumper", "[dump]")
{
    Dump dmp;

    SECTION("booleans and integers")
    {
        REQUIRE(dmp.any(true) == "true");
        REQUIRE(dmp.any(false) == "false");
        REQUIRE(dmp.any(-5) == "-5");
        REQUIRE(dmp.any(uint64_t(18446744073709551615ULL)) ==
                "18446744073709551615");
    }

    SECTION("floats use the shortest fixed form")
    {
        REQUIRE(dmp.any(1.5) == "1.5");
        REQUIRE(dmp.any(0.1) == "0.1");
        REQUIRE(dmp.any(0.1f) == "0.1");
        REQUIRE(dmp.any(3.0) == "3");
        REQUIRE(dmp.any(1e20) == "100000000000000000000");
    }

    SECTION("complex numbers")
    {
        REQUIRE(dmp.any(std::complex<double>(1, -2)) == "(1-2i)");
        REQUIRE(dmp.any(std::complex<double>(1.5, 2)) == "(1.5+2i)");
    }

    SECTION("strings are quoted")
    {
        REQUIRE(dmp.any(std::string("abc")) == "\"abc\"");
        REQUIRE(dmp.any("abc") == "\"abc\"");
    }

    SECTION("null C strings")
    {
        char const* nullCs = nullptr;
        REQUIRE(dmp.any(nullCs) == "nullptr");
        REQUIRE(Dump({flat()}).any(nullCs) == "nullptr");
    }

    SECTION("multi-line strings are written as is")
    {
        REQUIRE(dmp.any(std::string("a\nb")) == "a\nb");
    }

    SECTION("flat strings are escaped")
    {
        Dump flatDmp({flat()});
        REQUIRE(flatDmp.any(std::string("a\nb")) == "\"a\\nb\"");
    }

    SECTION("short strings are escaped")
    {
        Dump shortDmp({flatStrings(3)});
        REQUIRE(shortDmp.any(std::string("a\nb")) == "\"a\\nb\"");
        REQUIRE(shortDmp.any(std::string("a\nbc")) == "a\nbc");
    }

    SECTION("usage error")
    {
        Point pt;
        REQUIRE(simpleDumper(dmp, 1, Value::of(pt)) ==
                std::string("  ") + ValErrUsage);
    }
}

TEST_CASE("pointer dumper", "[dump]")
{
    int x = 5;
    int* p = &x;
    int* np = nullptr;

    REQUIRE(Dump().any(p) == "5");
    REQUIRE(Dump().any(np) == "nullptr");
    REQUIRE(Dump({ptrAddr()}).any(np) == "<0x0>");
    REQUIRE(Dump({ptrAddr()}).any(p) ==
            fmt::format("<0x{:x}>", reinterpret_cast<uintptr_t>(&x)));
    REQUIRE(ptrDumper(Dump(), 0, Value::of(x)) == ValErrUsage);
}

TEST_CASE("record dumper", "[dump]")
{
    Point pt{1, 2};

    SECTION("one field per line")
    {
        REQUIRE(Dump().any(pt) == "{\n  X: 1,\n  Y: 2,\n}");
    }

    SECTION("flat")
    {
        REQUIRE(Dump({flat()}).any(pt) == "{X: 1, Y: 2}");
    }

    SECTION("indent")
    {
        REQUIRE(Dump({indent(1)}).any(pt) == "  {\n    X: 1,\n    Y: 2,\n  }");
    }

    SECTION("nested values")
    {
        Wrapper w{{1, 2}, {{3, 4}}};
        std::string want = "{\n"
                           "  Inner: {\n"
                           "    X: 1,\n"
                           "    Y: 2,\n"
                           "  },\n"
                           "  Points: std::vector<Point>{\n"
                           "    {\n"
                           "      X: 3,\n"
                           "      Y: 4,\n"
                           "    },\n"
                           "  },\n"
                           "}";
        REQUIRE(Dump().any(w) == want);
        REQUIRE(Dump({flat()}).any(w) ==
                "{Inner: {X: 1, Y: 2}, Points: std::vector<Point>{{X: 3, Y: "
                "4}}}");
    }

    SECTION("hidden fields")
    {
        Account acc("joe", 10);
        REQUIRE(Dump({flat()}).any(acc) ==
                "{mBalance: <inaccessible>, Owner: \"joe\"}");
    }
}

TEST_CASE("sequence and map dumpers", "[dump]")
{
    SECTION("empty sequence")
    {
        std::vector<int> v;
        REQUIRE(Dump().any(v) == "std::vector<int>{}");
    }

    SECTION("sequence")
    {
        std::array<int, 2> a{{1, 2}};
        REQUIRE(Dump().any(a) == "std::array<int, 2>{\n  1,\n  2,\n}");
        REQUIRE(Dump({flat()}).any(a) == "std::array<int, 2>{1, 2}");
    }

    SECTION("map keys are sorted")
    {
        std::map<std::string, int> m{{"b", 2}, {"a", 1}};
        REQUIRE(Dump().any(m) ==
                "std::map<std::string, int>{\n  \"a\": 1,\n  \"b\": 2,\n}");
        REQUIRE(Dump({flat()}).any(m) ==
                "std::map<std::string, int>{\"a\": 1, \"b\": 2}");
    }

    SECTION("keys are ordered by their rendering")
    {
        std::unordered_map<int, int> m{{9, 1}, {10, 2}, {2, 3}};
        auto keys = Dump().sortedKeys(Value::of(m));
        REQUIRE(keys.size() == 3);
        REQUIRE(keys[0].first == "10");
        REQUIRE(keys[1].first == "2");
        REQUIRE(keys[2].first == "9");
    }

    SECTION("usage error")
    {
        REQUIRE(mapDumper(Dump(), 0, Value::of(1)) == ValErrUsage);
        REQUIRE(sequenceDumper(Dump(), 0, Value::of(1)) == ValErrUsage);
        REQUIRE(recordDumper(Dump(), 0, Value::of(1)) == ValErrUsage);
    }
}

TEST_CASE("other kinds", "[dump]")
{
    SECTION("invalid")
    {
        REQUIRE(Dump().any(Value()) == ValNil);
    }

    SECTION("variants")
    {
        std::variant<std::monostate, int> var;
        REQUIRE(Dump().any(var) == "nullptr");
        var = 3;
        REQUIRE(Dump().any(var) == "3");
    }

    SECTION("chrono")
    {
        REQUIRE(Dump().any(std::chrono::milliseconds(5)) == "5ms");
    }

    SECTION("inaccessible")
    {
        REQUIRE(Dump().any(Value::inaccessible<int>()) == ValInaccessible);
    }
}

TEST_CASE("custom dumpers", "[dump]")
{
    Dump dmp({withDumper<int>([](Dump const& d, int lvl, Value const& val) {
        return fmt::format("int({})", val.intValue());
    })});

    REQUIRE(dmp.hasDumper(adapterOf<int>().id()));
    REQUIRE(dmp.any(7) == "int(7)");
    std::vector<int> v{1};
    REQUIRE(Dump({flat(), withDumper<int>([](Dump const&, int,
                                             Value const& val) {
                      return fmt::format("int({})", val.intValue());
                  })})
                .any(v) == "std::vector<int>{int(1)}");

    SECTION("empty renderers are ignored")
    {
        Dump empty({withDumper<int>(Dumper())});
        REQUIRE_FALSE(empty.hasDumper(adapterOf<int>().id()));
        REQUIRE(empty.any(7) == "7");
    }
}

TEST_CASE("key string", "[dump]")
{
    Dump dmp({indent(3)});
    std::string s = "a\nb";
    Point pt{1, 2};
    REQUIRE(dmp.keyString(Value::of(s)) == "\"a\\nb\"");
    REQUIRE(dmp.keyString(Value::of(pt)) == "{X: 1, Y: 2}");
    REQUIRE(dmp.keyString(Value::of(42)) == "42");
}
}
}
