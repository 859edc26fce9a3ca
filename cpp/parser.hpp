#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "location.hpp"
#include "matching.hpp"
#include "parse_error.hpp"

using Unit = std::monostate;

template<typename T>
using Ok = std::pair<T, Location>;

// A failed attempt. A committed failure must not be recovered from by an
// enclosing alternative.
struct Err
{
	ParseError error;
	bool committed = false;
};

template<typename T>
using Result = std::variant<Ok<T>, Err>;

template<typename T>
Result<T> ok(T val, Location loc)
{
	return Ok<T>{std::move(val), std::move(loc)};
}

template<typename T>
Result<T> err(ParseError error)
{
	return Err{std::move(error)};
}

// Raised for a grammar that cannot terminate, e.g. repeating a parser that
// succeeds without consuming input. Never produced by malformed documents.
struct GrammarError : std::logic_error
{
	using std::logic_error::logic_error;
};

template<typename A>
class Parser
{
public:
	using value_type = A;
	using function_type = std::function<Result<A>(const Location&)>;

	explicit Parser(function_type f)
		: body(std::make_shared<const function_type>(std::move(f)))
	{
	}

	auto operator()(const Location& loc) const -> Result<A>
	{
		return (*body)(loc);
	}

private:
	std::shared_ptr<const function_type> body;
};

template<typename A>
auto attempt(const Parser<A>& p, const Location& loc) -> Result<A>
{
	return p(loc);
}

template<typename T>
using Parsed = std::variant<T, ParseError>;

// Runs p from the start of text. Input left over after p is not an error here.
template<typename A>
auto run(const Parser<A>& p, std::string text) -> Parsed<A>
{
	return match(attempt(p, Location::start(std::move(text))),
		[](A&& value, Location) {
			return Parsed<A>{std::in_place_index<0>, std::move(value)};
		},
		[](Err&& e) {
			return Parsed<A>{std::in_place_index<1>, std::move(e.error)};
		});
}
