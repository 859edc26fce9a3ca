#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <ostream>
#include <type_traits>

#include "parse_error.hpp"

struct Null
{
	bool operator==(const Null&) const = default;
};

struct Json;

using Array = std::vector<Json>;
using Object = std::unordered_map<std::string, Json>;

struct Json
{
	using t = std::variant<Null, bool, double, std::string, Array, Object>;

	bool operator==(const Json& other) const {return value == other.value;};

	t value;
};

static_assert(std::is_nothrow_move_constructible_v<Json>);
static_assert(std::is_aggregate_v<Json>);

using JsonResult = std::variant<Json, ParseError>;

inline Json null()
{
	return Json{Null{}};
}

inline Json True()
{
	return Json{true};
}

inline Json False()
{
	return Json{false};
}

// Parses a complete document: one value, optionally surrounded by whitespace.
auto parse(std::string_view s) -> JsonResult;

// Escapes text for a JSON string literal, without the quotes.
auto escape(const std::string& str) -> std::string;

std::ostream& operator<<(std::ostream& o, const Json& json);
