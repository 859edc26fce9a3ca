#include "location.hpp"

#include <algorithm>
#include <utility>

auto Location::start(std::string text) -> Location
{
	return Location{std::make_shared<const std::string>(std::move(text)), 0, 0};
}

auto Location::consumed_since(const Location& start) const -> std::string_view
{
	return std::string_view(*text).substr(start.offset, offset - start.offset);
}

auto Location::line() const -> std::size_t
{
	const auto begin = std::begin(*text);
	return 1 + std::count(begin, begin + offset, '\n');
}

bool is_continuation_byte(char ch)
{
	return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

auto Location::column() const -> std::size_t
{
	const std::string_view before = std::string_view(*text).substr(0, offset);
	const auto newline = before.rfind('\n');
	const std::string_view current = newline == std::string_view::npos ? before : before.substr(newline + 1);
	return 1 + std::count_if(std::begin(current), std::end(current), [](char ch){ return not is_continuation_byte(ch); });
}

std::ostream& operator<<(std::ostream& o, const Location& loc)
{
	return o << "line " << loc.line() << ", column " << loc.column();
}
