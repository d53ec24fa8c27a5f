#include <catch2/catch_test_macros.hpp>
#include <rivet/rpc/rpc_types.hpp>
#include <rivet/rpc/value.hpp>
#include <rivet/util/base64.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace rivet::rpc;

TEST_CASE("Value construction picks the type", "[rpc][value]") {
    REQUIRE(value().is_nil());
    REQUIRE(value(nullptr).is_nil());
    REQUIRE(value(true).is_bool());
    REQUIRE(value(42).is_int());
    REQUIRE(value(int64_t{1} << 40).is_int());
    REQUIRE(value(2.5).is_double());
    REQUIRE(value(1.5f).is_double());
    REQUIRE(value("text").is_string());
    REQUIRE(value(std::string("text")).is_string());
    REQUIRE(value(std::string_view("text")).is_string());
    REQUIRE(value(binary{"\x01\x02"}).is_binary());
    REQUIRE(value(datetime("19980717T14:08:55")).is_datetime());
    REQUIRE(value(value::array{1, 2}).is_array());
    REQUIRE(value(value::structure{{"a", 1}}).is_struct());
}

TEST_CASE("Value type names", "[rpc][value]") {
    REQUIRE(std::string(value().type_name()) == "nil");
    REQUIRE(std::string(value(1).type_name()) == "int");
    REQUIRE(std::string(value(make_binary("x")).type_name()) == "base64");
    REQUIRE(std::string(value(make_datetime(0)).type_name()) == "dateTime.iso8601");
    REQUIRE(std::string(value(value::structure{}).type_name()) == "struct");
}

TEST_CASE("Value accessors reject the wrong type", "[rpc][value]") {
    value v("hello");

    REQUIRE(v.as_string() == "hello");
    try {
        (void)v.as_int();
        FAIL("as_int on a string must throw");
    } catch (const type_error& e) {
        REQUIRE(e.code() == to_int(error_code::invalid_params));
        REQUIRE(std::string(e.what()) == "Expected int, got string");
    }

    REQUIRE_THROWS_AS(v.as_array(), type_error);
    REQUIRE_THROWS_AS(v["key"], type_error);
    REQUIRE(value(7).as_double() == 7.0);
}

TEST_CASE("Value arrays and structs", "[rpc][value]") {
    value list = value::array{1, "two", 3.0};
    REQUIRE(list.size() == 3);
    REQUIRE(list[1].as_string() == "two");
    REQUIRE_THROWS_AS(list[3], type_error);

    value rec = value::structure{{"name", "rivet"}, {"tags", value::array{"a", "b"}}};
    REQUIRE(rec.size() == 2);
    REQUIRE(rec["name"].as_string() == "rivet");
    REQUIRE(rec.contains("tags"));
    REQUIRE(rec.find("missing") == nullptr);
    REQUIRE_THROWS_AS(rec["missing"], type_error);

    REQUIRE(rec.dump() == "{name: \"rivet\", tags: [\"a\", \"b\"]}");
}

TEST_CASE("Values compare by content", "[rpc][value]") {
    REQUIRE(value(value::array{1, "x"}) == value(value::array{1, "x"}));
    REQUIRE(value(1) != value(1.0));
    REQUIRE(value(1) != value(true));
    REQUIRE(make_binary("ab") == make_binary("ab"));
}

TEST_CASE("Fault helpers", "[rpc][value]") {
    auto f = make_fault(error_code::method_not_found, "Procedure x not found.");
    REQUIRE(is_fault(f));
    REQUIRE(f["faultCode"].as_int() == -1);
    REQUIRE(f["faultString"].as_string() == "Procedure x not found.");

    REQUIRE_FALSE(is_fault(value::structure{{"faultCode", 1}}));
    REQUIRE_FALSE(is_fault(value("faultCode")));

    auto parsed = fault::from_value(f);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->code == -1);
    REQUIRE(parsed->message == "Procedure x not found.");
    REQUIRE(parsed->to_value() == f);
    REQUIRE_FALSE(fault::from_value(value(1)).has_value());
}

TEST_CASE("Datetime conversion", "[rpc][value]") {
    REQUIRE(make_datetime(0).as_datetime().iso8601() == "19700101T00:00:00");
    REQUIRE(make_datetime(1700000000).as_datetime().iso8601() == "20231114T22:13:20");

    REQUIRE(timestamp(value(datetime("19980717T14:08:55"))) == 900684535);
    REQUIRE(timestamp(value(datetime("1998-07-17T14:08:55Z"))) == 900684535);
    REQUIRE(timestamp(make_datetime(1700000000)) == 1700000000);
}

TEST_CASE("Datetime conversion rejects non-datetimes", "[rpc][value]") {
    try {
        (void)timestamp(value(12));
        FAIL("timestamp on an int must throw");
    } catch (const invalid_argument& e) {
        REQUIRE(e.code() == to_int(error_code::not_a_datetime));
        REQUIRE(std::string(e.what()) == "Variable is not of type datetime");
    }

    REQUIRE_THROWS_AS(timestamp(value(datetime("yesterday"))), invalid_argument);
    REQUIRE_THROWS_AS(timestamp(value(datetime("1998071XT14:08:55"))), invalid_argument);
}

TEST_CASE("Binary helpers", "[rpc][value]") {
    std::string bytes("\x00\xff\x10", 3);
    auto v = make_binary(bytes);
    REQUIRE(v.is_binary());
    REQUIRE(binary_string(v) == bytes);
    REQUIRE_THROWS_AS(binary_string(value("plain")), type_error);
}

TEST_CASE("Base64 codec", "[util][base64]") {
    using rivet::util::base64_decode;
    using rivet::util::base64_encode;

    REQUIRE(base64_encode("hello world") == "aGVsbG8gd29ybGQ=");
    REQUIRE(base64_encode(std::string("\x00\xff\x10", 3)) == "AP8Q");
    REQUIRE(base64_encode("").empty());

    REQUIRE(base64_decode("aGVsbG8gd29ybGQ=") == "hello world");
    REQUIRE(base64_decode("aGVsbG8g\r\nd29ybGQ=") == "hello world");
    REQUIRE_FALSE(base64_decode("aGVs*G8=").has_value());
    REQUIRE_FALSE(base64_decode("aGU=bG8=").has_value());
}

TEST_CASE("Native type mapping", "[rpc][value]") {
    REQUIRE(from_value<int>(value(5)) == 5);
    REQUIRE(from_value<double>(value(5)) == 5.0);
    REQUIRE(from_value<std::string>(value("s")) == "s");
    REQUIRE(from_value<std::optional<int>>(value()) == std::nullopt);
    REQUIRE(from_value<std::optional<int>>(value(3)) == 3);

    auto ints = from_value<std::vector<int>>(value(value::array{1, 2, 3}));
    REQUIRE(ints == std::vector<int>{1, 2, 3});

    auto map = from_value<std::map<std::string, std::string>>(
        value(value::structure{{"k", "v"}}));
    REQUIRE(map.at("k") == "v");

    REQUIRE_THROWS_AS(from_value<int>(value("5")), type_error);

    REQUIRE(to_value(std::vector<std::string>{"a", "b"}) == value(value::array{"a", "b"}));
    REQUIRE(to_value(std::map<std::string, int>{{"x", 1}}) ==
            value(value::structure{{"x", 1}}));
    REQUIRE(to_value(std::optional<int>()).is_nil());
    REQUIRE(to_value(7) == value(7));
}
