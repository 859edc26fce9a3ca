#pragma once

#include <cstddef>
#include <string>

#include "combinators.hpp"
#include "json.hpp"

// Arrays and objects nested deeper than this are rejected.
constexpr std::size_t max_depth = 256;

bool is_ws(char c);
bool is_digit(char ch);
bool is_hex(char ch);

auto whitespace() -> Parser<Unit>;

template<typename A>
auto token(const Parser<A>& p) -> Parser<A>
{
	return skip_right(p, whitespace());
}

auto json_null() -> Parser<Json>;
auto json_bool() -> Parser<Json>;
auto json_number() -> Parser<Json>;
auto string_literal() -> Parser<std::string>;
auto json_string() -> Parser<Json>;
auto json_array() -> Parser<Json>;
auto json_object() -> Parser<Json>;

// A value with the whitespace around it. Built once; array and object
// elements refer back to it lazily.
auto json_value() -> const Parser<Json>&;

// A value followed by the end of the input.
auto json_document() -> const Parser<Json>&;
