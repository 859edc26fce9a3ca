#include "primitives.hpp"

auto literal(std::string s) -> Parser<std::string>
{
	return Parser<std::string>([s = std::move(s)](const Location& loc) {
		if (loc.remaining().starts_with(s)) return ok(s, loc.advance(s.size()));
		return err<std::string>(expected(loc, "'" + s + "'"));
	});
}

auto char_class(std::function<bool(char)> predicate, std::string description) -> Parser<char>
{
	return Parser<char>([predicate = std::move(predicate), description = std::move(description)](const Location& loc) {
		const auto s = loc.remaining();
		if (not s.empty() and predicate(s.front())) return ok(s.front(), loc.advance(1));
		return err<char>(expected(loc, description));
	});
}

auto eof() -> Parser<Unit>
{
	return Parser<Unit>([](const Location& loc) {
		if (loc.at_end()) return ok(Unit{}, loc);
		return err<Unit>(ParseError(Frame{loc, Error::Garbage, "unexpected trailing data"}));
	});
}
