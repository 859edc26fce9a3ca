#pragma once

#include <functional>
#include <string>
#include <utility>

#include "parser.hpp"

auto literal(std::string s) -> Parser<std::string>;

auto char_class(std::function<bool(char)> predicate, std::string description) -> Parser<char>;

// Succeeds only when no input is left.
auto eof() -> Parser<Unit>;

template<typename A>
auto succeed(A value) -> Parser<A>
{
	return Parser<A>([value = std::move(value)](const Location& loc) {
		return ok(value, loc);
	});
}

template<typename A>
auto fail(Error code, std::string message) -> Parser<A>
{
	return Parser<A>([code, message = std::move(message)](const Location& loc) {
		return err<A>(ParseError(Frame{loc, code, message}));
	});
}

template<typename A>
auto fail(std::string message) -> Parser<A>
{
	return fail<A>(Error::Failure, std::move(message));
}
