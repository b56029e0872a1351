#include <doctest/doctest.h>
#include "dynobj.hpp"
#include <sstream>

using namespace dynobj;

//=============================================================================
// Test schema definitions
//=============================================================================

struct Point {
    Field<std::int64_t, "x"> x;
    Field<std::int64_t, "y"> y;
};

//=============================================================================
// Edn tests
//=============================================================================

TEST_SUITE("Edn") {

TEST_CASE("reads scalars") {
    CHECK(edn::read("nil").isNil());
    CHECK(edn::read("true") == Value(true));
    CHECK(edn::read("false") == Value(false));
    CHECK(edn::read("42") == Value(42));
    CHECK(edn::read("-7") == Value(-7));
    CHECK(edn::read("42N") == Value(42));
    CHECK(edn::read("2.5") == Value(2.5));
    CHECK(edn::read("1e3") == Value(1000.0));
    CHECK(edn::read(R"("hi\n")") == Value("hi\n"));
    CHECK(edn::read(R"("é")") == Value("\xc3\xa9"));
    CHECK(edn::read(":kw") == Value("kw"_kw));
    CHECK(edn::read(":my/kw") == Value("my/kw"_kw));
    CHECK(edn::read(R"(\a)") == Value("a"));
    CHECK(edn::read(R"(\newline)") == Value("\n"));
}

TEST_CASE("reads collections") {
    auto const vector = edn::read("[1 2 3]");
    REQUIRE(vector.is<ValueVector>());
    CHECK(vector.getIf<ValueVector>()->size() == 3);

    CHECK(edn::read("(1 2 3)") == vector);

    auto const set = edn::read("#{1 2}");
    REQUIRE(set.is<ValueSet>());
    CHECK(set.getIf<ValueSet>()->size() == 2);

    auto const map = edn::read("{:a 1, :b [2]}");
    REQUIRE(map.is<Map>());
    CHECK(map.getIf<Map>()->size() == 2);
    CHECK(map.getIf<Map>()->get("a"_kw) == Value(1));
    CHECK(map.getIf<Map>()->get("c"_kw).isNil());
}

TEST_CASE("skips comments and discarded forms") {
    CHECK(edn::read("; leading comment\n [1 #_2 3] ; trailing") == edn::read("[1 3]"));
    CHECK(edn::read("{:a 1 #_:b #_2}") == edn::read("{:a 1}"));
}

TEST_CASE("rejects malformed input") {
    CHECK_THROWS_AS(edn::read(""), edn::ParseError);
    CHECK_THROWS_AS(edn::read("{:a}"), edn::ParseError);
    CHECK_THROWS_AS(edn::read("[1 2"), edn::ParseError);
    CHECK_THROWS_AS(edn::read("1 2"), edn::ParseError);
    CHECK_THROWS_AS(edn::read("{:a 1 :a 2}"), edn::ParseError);
    CHECK_THROWS_AS(edn::read("#{1 1}"), edn::ParseError);
    CHECK_THROWS_AS(edn::read(R"("open)"), edn::ParseError);
    CHECK_THROWS_AS(edn::read("symbol"), edn::ParseError);
    CHECK_THROWS_AS(edn::read("{:a foo}"), edn::ParseError);
    CHECK_THROWS_AS(edn::read("[1 my/name]"), edn::ParseError);
    CHECK_THROWS_AS(edn::read("99999999999999999999"), edn::ParseError);

    try
    {
        edn::read("[1 }");
        FAIL("expected a parse error");
    }
    catch (edn::ParseError const& e)
    {
        CHECK(e.offset() == 3);
    }
}

TEST_CASE("unicode escapes") {
    CHECK(edn::read(R"("a\u00e9")") == Value("a\xc3\xa9"));
    CHECK(edn::read(R"("\u20ac")") == Value("\xe2\x82\xac"));
    CHECK(edn::read(R"("\uD83D\uDE00")") == Value("\xf0\x9f\x98\x80"));
    CHECK(edn::read(R"("\udbff\udfff")") == Value("\xf4\x8f\xbf\xbf"));
    CHECK(edn::read(R"(\u00e9)") == Value("\xc3\xa9"));

    CHECK_THROWS_AS(edn::read(R"("\uD83D")"), edn::ParseError);
    CHECK_THROWS_AS(edn::read(R"("\uD83Dx")"), edn::ParseError);
    CHECK_THROWS_AS(edn::read(R"("\uD83D\u0041")"), edn::ParseError);
    CHECK_THROWS_AS(edn::read(R"("\uDE00")"), edn::ParseError);
    CHECK_THROWS_AS(edn::read(R"(\uD83D)"), edn::ParseError);

    try
    {
        edn::read(R"("\uD83D")");
        FAIL("expected a parse error");
    }
    catch (edn::ParseError const& e)
    {
        CHECK(e.offset() == 1);
    }
}

TEST_CASE("writes canonical text") {
    CHECK(edn::write(edn::read("{:b 2 :a 1}")) == "{:a 1, :b 2}");
    CHECK(edn::write(edn::read("#{3 1 2}")) == "#{1 2 3}");
    CHECK(edn::write(Value(1.0)) == "1.0");
    CHECK(edn::write(Value(-0.25)) == "-0.25");
    CHECK(edn::write(Value("a\"b")) == R"("a\"b")");
    CHECK(edn::write(Value()) == "nil");
    CHECK(edn::write(edn::read("(1 2)")) == "[1 2]");
}

TEST_CASE("written text reads back to an equal value") {
    auto const text = R"({:a [1 2.5 "x"], :b #{:k}, :c nil, :d {:e true}})";
    auto const value = edn::read(text);

    CHECK(edn::write(value) == text);
    CHECK(edn::read(edn::write(value)) == value);
}

TEST_CASE("instants") {
    auto const value = edn::read(R"(#inst "1985-04-12T23:20:50.52Z")");

    REQUIRE(value.is<Instant>());
    CHECK(edn::write(value) == R"(#inst "1985-04-12T23:20:50.520-00:00")");
    CHECK(edn::read(R"(#inst "1985-04-12T19:20:50.52-04:00")") == value);
    CHECK(edn::read(R"(#inst "1985-04-12")") == Value(*parseInstant("1985-04-12T00:00:00Z")));

    CHECK_THROWS_AS(edn::read(R"(#inst "yesterday")"), edn::ParseError);
    CHECK_THROWS_AS(edn::read("#inst 5"), edn::ParseError);
    CHECK_FALSE(parseInstant("1985-13-12").has_value());
}

TEST_CASE("instants beyond four digit years") {
    using namespace std::chrono;

    auto const last = parseInstant("9999-12-31T23:59:59.999Z");
    REQUIRE(last.has_value());
    CHECK(formatInstant(*last) == "9999-12-31T23:59:59.999-00:00");

    auto const next = *last + milliseconds(1);
    CHECK(formatInstant(next) == "+10000-01-01T00:00:00.000-00:00");
    CHECK(parseInstant("+10000-01-01T00:00:00Z") == next);

    auto const first = parseInstant("0000-01-01");
    REQUIRE(first.has_value());
    CHECK(formatInstant(*first) == "0000-01-01T00:00:00.000-00:00");

    auto const before = *first - milliseconds(1);
    CHECK(formatInstant(before) == "-0001-12-31T23:59:59.999-00:00");
    CHECK(parseInstant("-0001-12-31T23:59:59.999Z") == before);

    for (auto const instant : { next, before, *parseInstant("-32767-01-01"), *parseInstant("+32767-12-31T12:00:00Z") })
    {
        auto const value = Value(instant);
        CHECK(edn::read(edn::write(value)) == value);
    }

    CHECK_FALSE(parseInstant("10000-01-01").has_value());
    CHECK_FALSE(parseInstant("+999-01-01").has_value());
    CHECK_FALSE(parseInstant("+100000-01-01").has_value());
    CHECK_FALSE(parseInstant("+40000-01-01").has_value());

    auto const beyond = Instant(sys_days(year::max() / December / 31) + days(1));
    CHECK_THROWS_AS(formatInstant(beyond), std::out_of_range);
    CHECK_THROWS_AS(edn::write(Value(beyond)), std::out_of_range);
}

TEST_CASE("unknown tags are preserved") {
    auto const value = edn::read(R"(#uuid "abc")");

    REQUIRE(value.is<Tagged>());
    CHECK(value.getIf<Tagged>()->tag == "uuid");
    CHECK(edn::write(value) == R"(#uuid "abc")");
}

TEST_CASE("registered tags decode to typed maps") {
    registerTag<Point>("my/point");

    auto const value = edn::read("#my/point{:x 1 :y 2}");
    REQUIRE(value.is<Map>());
    CHECK(value.getIf<Map>()->typeKey() == schemaOf<Point>().typeKey());
    CHECK(edn::write(value) == "#my/point{:x 1, :y 2}");

    auto const object = fromTagged(value);
    REQUIRE(object.has_value());
    CHECK(&object->getType() == &schemaOf<Point>());

    auto const point = instanceOf<Point>(*object);
    REQUIRE(point.has_value());
    CHECK((*point)->y() == 2);

    CHECK_THROWS_AS(edn::read("#my/point 5"), edn::ParseError);

    // rebinding the type to a new tag drops the old one
    registerTag<Point>("geo/point");
    CHECK_FALSE(edn::TagRegistry::instance().byTag("my/point").has_value());
    CHECK(edn::write(value) == "#geo/point{:x 1, :y 2}");

    CHECK(deregisterTag<Point>());
    CHECK(edn::read("#geo/point{:x 1 :y 2}").is<Tagged>());
    CHECK(edn::write(value) == "{:x 1, :y 2}");
    CHECK_FALSE(fromTagged(value).has_value());
}

TEST_CASE("pretty printing breaks wide collections") {
    auto const value = edn::read(R"({:alpha [1 2 3], :beta "some long string"})");

    auto const pretty = edn::writePretty(value, { .width = 20 });
    CHECK(pretty.find('\n') != std::string::npos);
    CHECK(edn::read(pretty) == value);

    CHECK(edn::writePretty(value) == edn::write(value));

    std::ostringstream ss;
    edn::writePretty(ss, value, { .width = 20, .indent = 2 });
    CHECK(edn::read(ss.str()) == value);
}

TEST_CASE("metadata takes no part in equality or hashing") {
    auto const map = *edn::read("{:a 1}").getIf<Map>();
    auto const annotated = map.withMeta("origin", "test");

    CHECK(annotated == map);
    CHECK(hashValue(annotated) == hashValue(map));
    CHECK(annotated.meta("origin") == Value("test"));
    CHECK(map.meta("origin").isNil());
}

TEST_CASE("map entries hash independently of insertion order") {
    auto const a = Map().assoc("a"_kw, 1).assoc("b"_kw, 2);
    auto const b = Map().assoc("b"_kw, 2).assoc("a"_kw, 1);

    CHECK(a == b);
    CHECK(hashValue(a) == hashValue(b));
    CHECK(hashValue(edn::read("[1 2]")) != hashValue(edn::read("[2 1]")));
}

TEST_CASE("formatting") {
    auto const value = edn::read("[:a 1]");

    std::ostringstream ss;
    ss << value;

    CHECK(ss.str() == "[:a 1]");
    CHECK(std::format("{}", value) == "[:a 1]");
    CHECK(value.shape() == "vector");
}

} // TEST_SUITE("Edn")
