#include <catch2/catch.hpp>

#include <cstddef>
#include <iterator>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "combinators.hpp"
#include "json.hpp"

namespace
{

const std::vector<std::string> string_pieces = {
	"a", "Z", "0", " ", "\"", "\\", "/", "\n", "\t", "\x01", "\x1f",
	"\xC3\xA9", "\xE2\x82\xAC", "\xF0\x9F\x98\x80", "key", "",
};

auto random_string(std::mt19937& rng) -> std::string
{
	std::uniform_int_distribution<std::size_t> length(0, 6);
	std::uniform_int_distribution<std::size_t> piece(0, string_pieces.size() - 1);
	std::string s;
	for (auto n = length(rng); n > 0; --n) s += string_pieces[piece(rng)];
	return s;
}

auto random_number(std::mt19937& rng) -> double
{
	std::uniform_int_distribution<int> kind(0, 3);
	switch (kind(rng))
	{
		case 0: return std::uniform_int_distribution<int>(-1000, 1000)(rng);
		case 1: return std::uniform_real_distribution<double>(-1.0, 1.0)(rng);
		case 2: return std::uniform_real_distribution<double>(-1e6, 1e6)(rng);
		default:
		{
			const double mantissa = std::uniform_real_distribution<double>(1.0, 10.0)(rng);
			const int exponent = std::uniform_int_distribution<int>(-300, 300)(rng);
			return std::stod(std::to_string(mantissa) + "e" + std::to_string(exponent));
		}
	}
}

auto random_json(std::mt19937& rng, int depth) -> Json
{
	std::uniform_int_distribution<int> kind(0, depth > 0 ? 5 : 3);
	switch (kind(rng))
	{
		case 0: return null();
		case 1: return Json{std::uniform_int_distribution<int>(0, 1)(rng) == 1};
		case 2: return Json{random_number(rng)};
		case 3: return Json{random_string(rng)};
		case 4:
		{
			Array arr;
			for (auto n = std::uniform_int_distribution<int>(0, 4)(rng); n > 0; --n)
			{
				arr.push_back(random_json(rng, depth - 1));
			}
			return Json{std::move(arr)};
		}
		default:
		{
			Object obj;
			for (auto n = std::uniform_int_distribution<int>(0, 4)(rng); n > 0; --n)
			{
				obj.insert_or_assign(random_string(rng), random_json(rng, depth - 1));
			}
			return Json{std::move(obj)};
		}
	}
}

auto render(const Json& json) -> std::string
{
	std::ostringstream o;
	o << json;
	return o.str();
}

// Re-emits the tokens of a rendered document with random whitespace between
// them. Strings are copied verbatim.
auto respace(const std::string& text, std::mt19937& rng) -> std::string
{
	static const std::string blanks[] = {"", " ", "\n", "\t", "\r\n", "   "};
	std::uniform_int_distribution<std::size_t> blank(0, std::size(blanks) - 1);
	std::string out = blanks[blank(rng)];
	bool in_string = false;
	for (std::size_t i = 0; i < text.size(); ++i)
	{
		const char ch = text[i];
		if (in_string)
		{
			out += ch;
			if (ch == '\\') out += text[++i];
			else if (ch == '"') in_string = false;
			continue;
		}
		switch (ch)
		{
			case ' ':
				break;
			case '"':
				in_string = true;
				out += ch;
				break;
			case '[': case ']': case '{': case '}': case ',': case ':':
				out += blanks[blank(rng)];
				out += ch;
				out += blanks[blank(rng)];
				break;
			default:
				out += ch;
		}
	}
	return out + blanks[blank(rng)];
}

}

TEST_CASE("rendered values parse back to the same value")
{
	std::mt19937 rng(20240611);
	for (int i = 0; i < 500; ++i)
	{
		const Json original = random_json(rng, 4);
		const std::string text = render(original);
		CAPTURE(text);
		const auto parsed = parse(text);
		REQUIRE(std::holds_alternative<Json>(parsed));
		CHECK(std::get<Json>(parsed) == original);
	}
}

TEST_CASE("extra whitespace between tokens does not change the result")
{
	std::mt19937 rng(7);
	for (int i = 0; i < 300; ++i)
	{
		const Json original = random_json(rng, 3);
		const std::string spaced = respace(render(original), rng);
		CAPTURE(spaced);
		const auto parsed = parse(spaced);
		REQUIRE(std::holds_alternative<Json>(parsed));
		CHECK(std::get<Json>(parsed) == original);
	}
}

TEST_CASE("non-finite numbers render as null")
{
	CHECK(render(Json{std::numeric_limits<double>::infinity()}) == "null");
	CHECK(render(Json{std::numeric_limits<double>::quiet_NaN()}) == "null");
	CHECK(render(Json{2.5}) == "2.5");
	CHECK(render(Json{Array{Json{1.0}, null(), Json{"x\n"}}}) == R"([1, null, "x\n"])");
	CHECK(render(Json{"\x01\x1f"}) == R"("\u0001\u001f")");
}

TEST_CASE("or_else with a succeeding first branch ignores the second")
{
	const auto throwing = Parser<std::string>([](const Location&) -> Result<std::string> {
		throw std::logic_error("second branch must not run");
	});
	const auto p = or_else(literal("ok"), throwing);
	const auto r = run(p, "ok");
	REQUIRE(std::holds_alternative<std::string>(r));
	CHECK(std::get<std::string>(r) == "ok");
}

TEST_CASE("the grammar can be shared between threads")
{
	const std::string document = R"({"a": [1, 2, {"b": "c"}], "d": null})";
	const auto expected_value = parse(document);
	REQUIRE(std::holds_alternative<Json>(expected_value));

	std::vector<int> matches(4, 0);
	std::vector<std::thread> workers;
	for (std::size_t t = 0; t < matches.size(); ++t)
	{
		workers.emplace_back([&, t] {
			for (int i = 0; i < 50; ++i)
			{
				const auto r = parse(document);
				if (std::holds_alternative<Json>(r) and std::get<Json>(r) == std::get<Json>(expected_value)) ++matches[t];
			}
		});
	}
	for (auto& worker: workers) worker.join();
	for (const auto m: matches) CHECK(m == 50);
}
