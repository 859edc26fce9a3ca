#include <catch2/catch.hpp>

#include "json.hpp"
#include "matching.hpp"

template <typename ...Jsons>
Array make_array(Jsons&&... jsons)
{
	Array arr;
	arr.reserve(sizeof...(jsons));
	(arr.push_back(std::forward<Jsons>(jsons)), ...);
	return arr;
}

template <typename ...Jsons>
Object make_object(std::pair<std::string, Jsons>&&... kvs)
{
	Object obj;
	(obj.insert(std::forward<std::pair<std::string, Jsons>>(kvs)), ...);
	return obj;
}

#define FAILS(f, arg, expected_error) \
	match(f(arg), \
		[](const Json& actual_json){ \
			CAPTURE(actual_json, expected_error); \
			CHECK(false); \
		}, \
		[](const ParseError& actual_error){ \
			CAPTURE(actual_error); \
			CHECK(expected_error == actual_error.code()); \
		})

#define OK(f, arg, expected_json) \
	match(f(arg), \
		[](const Json& actual_json){ \
			CHECK(actual_json == expected_json); \
		}, \
		[](const ParseError& actual_error){ \
			CAPTURE(actual_error, expected_json); \
			CHECK(false); \
		})

TEST_CASE("basic cases")
{
	FAILS(parse, "", Error::EndOfInput);
	FAILS(parse, "x", Error::Mismatch);
}

TEST_CASE("literals")
{
	OK(parse, "null", Json{Null{}});
	OK(parse, "true", Json{true});
	OK(parse, "false", Json{false});
	FAILS(parse, "truefalse", Error::Garbage);
	FAILS(parse, "nul", Error::Mismatch);
	FAILS(parse, "nullx", Error::Garbage);
}

TEST_CASE("numbers")
{
	OK(parse, "42", Json{42.0});
	OK(parse, "0", Json{0.0});
	OK(parse, "-1", Json{-1.0});
	OK(parse, "-0", Json{0.0});
	OK(parse, "1.23", Json{1.23});
	OK(parse, "1.230", Json{1.23});
	OK(parse, "6.999e3", Json{6999.0});
	OK(parse, "-1.2e9", Json{-1.2e9});
	OK(parse, "1E2", Json{100.0});
	OK(parse, "1e+2", Json{100.0});
	OK(parse, "25e-1", Json{2.5});
	OK(parse, "0.5", Json{0.5});
	OK(parse, "123456789012", Json{123456789012.0});
	FAILS(parse, "6.999e", Error::InvalidNumber);
	FAILS(parse, "6.999e+", Error::InvalidNumber);
	FAILS(parse, "1.", Error::InvalidNumber);
	FAILS(parse, "1.e1", Error::InvalidNumber);
	FAILS(parse, "1.x", Error::InvalidNumber);
	FAILS(parse, "01", Error::InvalidNumber);
	FAILS(parse, "-01", Error::InvalidNumber);
	FAILS(parse, "-", Error::InvalidNumber);
	FAILS(parse, "-.12", Error::InvalidNumber);
	FAILS(parse, ".12", Error::Mismatch);
	FAILS(parse, "+1", Error::Mismatch);
	OK(parse, "1e-400", Json{0.0});
	OK(parse, "-1e-400", Json{0.0});
	OK(parse, "0.0000001e-999", Json{0.0});
	OK(parse, "4.9e-324", Json{4.9e-324});
	OK(parse, "1.7976931348623157e308", Json{1.7976931348623157e308});
	FAILS(parse, "1e999", Error::InvalidNumber);
	FAILS(parse, "1.8e308", Error::InvalidNumber);
	FAILS(parse, "-1e400", Error::InvalidNumber);
	FAILS(parse, "1x", Error::Garbage);
}

TEST_CASE("strings")
{
	OK(parse, R"("")", (Json{std::string()}));
	FAILS(parse, R"(")", (Error::EndOfInput));
	OK(parse, R"("foobar")", (Json{std::string("foobar")}));
	OK(parse, R"("a\nb")", (Json{std::string("a\nb")}));
	OK(parse, R"("foo\\bar")", (Json{std::string(R"(foo\bar)")}));
	OK(parse, R"("foo bar")", (Json{std::string(R"(foo bar)")}));
	OK(parse, R"("foo/bar")", (Json{std::string(R"(foo/bar)")}));
	OK(parse, R"("foo\/bar")", (Json{std::string(R"(foo/bar)")}));
	OK(parse, R"("\b\f\n\r\t")", (Json{std::string("\b\f\n\r\t")}));
	FAILS(parse, R"("foobar)", (Error::EndOfInput));
	FAILS(parse, R"("foo"bar)", (Error::Garbage));
	FAILS(parse, R"("foo\"bar)", (Error::EndOfInput));
	OK(parse, R"(" a b c ")", (Json{std::string(R"( a b c )")}));
	OK(parse, R"("foo\"bar")", (Json{std::string(R"(foo"bar)")}));
	OK(parse, R"("\u0041")", (Json{std::string("A")}));
	OK(parse, R"("\u00e9")", (Json{std::string("\xC3\xA9")}));
	OK(parse, R"("\u20AC")", (Json{std::string("\xE2\x82\xAC")}));
	OK(parse, R"("foo\u0041bar")", (Json{std::string("fooAbar")}));
	OK(parse, R"("\uD83D\uDE00")", (Json{std::string("\xF0\x9F\x98\x80")}));
	OK(parse, "\"\xC3\xA9t\xC3\xA9\"", (Json{std::string("\xC3\xA9t\xC3\xA9")}));
	FAILS(parse, R"("\u12cx")", (Error::InvalidEscape));
	FAILS(parse, R"("\x")", (Error::InvalidEscape));
	FAILS(parse, R"("\uD83D")", (Error::InvalidEscape));
	FAILS(parse, R"("\uD83Dx")", (Error::InvalidEscape));
	FAILS(parse, R"("\uD83DA")", (Error::InvalidEscape));
	FAILS(parse, R"("\uDE00")", (Error::InvalidEscape));
	FAILS(parse, R"("\)", (Error::InvalidEscape));
	FAILS(parse, "\"a\nb\"", (Error::ControlCharacter));
	FAILS(parse, "\"a\tb\"", (Error::ControlCharacter));
}

TEST_CASE("arrays")
{
	OK(parse, R"([])", (Json{Array()}));
	OK(parse, R"([null])", (Json{make_array(null())}));
	OK(parse, R"([[null]])", (Json{make_array(Json{make_array(null())})}));
	OK(parse, R"([true,false])", (Json{make_array(True(), False())}));
	OK(parse, R"([1.2])", (Json{make_array(Json{1.2})}));
	OK(parse, R"(["abc"])", (Json{make_array(Json{"abc"})}));
	OK(parse, R"([[[]]])", (Json{make_array(Json{make_array(Json{make_array()})})}));
	OK(parse, R"([[["a"]]])", (Json{make_array(Json{make_array(Json{make_array(Json{"a"})})})}));
	OK(parse, R"([1, 2, 3])", (Json{make_array(Json{1.0}, Json{2.0}, Json{3.0})}));
	OK(parse, R"([true,false,null,0])", (Json{make_array(True(), False(), null(), Json{0.0})}));
	OK(parse, R"([[],[]])", (Json{make_array(Json{make_array()}, Json{make_array()})}));
	OK(parse, R"([1, "abc", [2, 3]])", (Json{make_array(Json{1.0}, Json{"abc"}, Json{make_array(Json{2.0}, Json{3.0})})}));
	FAILS(parse, R"([)", (Error::EndOfInput));
	FAILS(parse, R"(])", (Error::Mismatch));
	FAILS(parse, R"([[[)", (Error::EndOfInput));
	FAILS(parse, R"(["])", (Error::EndOfInput));
	FAILS(parse, R"([1,)", (Error::EndOfInput));
	FAILS(parse, R"([1,])", (Error::Mismatch));
	FAILS(parse, R"([1,2,])", (Error::Mismatch));
	FAILS(parse, R"([1 2])", (Error::Mismatch));
	FAILS(parse, R"([01])", (Error::InvalidNumber));
	FAILS(parse, R"([-])", (Error::InvalidNumber));
}

TEST_CASE("objects")
{
	OK(parse, R"({})", (Json{Object{}}));
	OK(parse, R"({"1":1})", (Json{make_object(
		std::pair{std::string{"1"}, Json{1.0}}
	)}));
	OK(parse, R"({"foo":"bar"})", (Json{make_object(
		std::pair{std::string{"foo"}, Json{"bar"}}
	)}));
	OK(parse, R"({"":""})", (Json(make_object(
		std::pair{std::string{""}, Json{""}}
	))));
	OK(parse, R"({"12":[]})", (Json(make_object(
		std::pair{std::string{"12"}, Json{make_array()}}
	))));
	OK(parse, R"({"a":1,"b":2,"c":3})", (Json(make_object(
		std::pair{std::string{"a"}, Json{1.0}},
		std::pair{std::string{"b"}, Json{2.0}},
		std::pair{std::string{"c"}, Json{3.0}}
	))));
	OK(parse, R"({"x":9.8e7})", (Json{make_object(
		std::pair{std::string{"x"}, Json{9.8e7}}
	)}));
	OK(parse, R"({"a": 1, "a": 2})", (Json{make_object(
		std::pair{std::string{"a"}, Json{2.0}}
	)}));
	OK(parse, R"({"a": {"b": [1, {"c": null}]}})", (Json{make_object(
		std::pair{std::string{"a"}, Json{make_object(
			std::pair{std::string{"b"}, Json{make_array(Json{1.0}, Json{make_object(
				std::pair{std::string{"c"}, null()}
			)})}}
		)}}
	)}));
	FAILS(parse, R"({"1":1)", (Error::EndOfInput));
	FAILS(parse, R"({"foo")", (Error::EndOfInput));
	FAILS(parse, R"({"foo":)", (Error::EndOfInput));
	FAILS(parse, R"({"a": })", (Error::Mismatch));
	FAILS(parse, R"({"a":1,})", (Error::Mismatch));
	FAILS(parse, R"({"a" 1})", (Error::Mismatch));
	FAILS(parse, R"({1:2})", (Error::Mismatch));
}

TEST_CASE("values with spaces")
{
	FAILS(parse, R"(   )", (Error::EndOfInput));
	FAILS(parse, R"( [  )", (Error::EndOfInput));
	OK(parse, R"(   null   )", (Json{Null{}}));
	OK(parse, R"(  true  )", (Json{True()}));
	OK(parse, R"(   false   )", (Json{False()}));
	OK(parse, "\t\r\n 1 \n", (Json{1.0}));
	OK(parse, R"([ true, false, null ])", (Json{make_array(
		True(), False(), null()
	)}));
	OK(parse, R"( [ true , false , null ] )", (Json{make_array(
		True(), False(), null()
	)}));
	OK(parse, R"( { "a" : true , "b" : false , "c" : null } )", (Json{make_object(
		std::pair{std::string{"a"}, True()},
		std::pair{std::string{"b"}, False()},
		std::pair{std::string{"c"}, null()}
	)}));
	OK(parse, R"( {  } )", (Json{Object{}}));
	OK(parse, R"( [  ] )", (Json{make_array()}));
}
