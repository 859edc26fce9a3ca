#pragma once

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

// Cursor into the input. Copies share the text; advancing yields a new value.
struct Location
{
	std::shared_ptr<const std::string> text;
	std::size_t offset = 0;
	// Open nesting levels; not part of the position.
	std::size_t depth = 0;

	static auto start(std::string text) -> Location;

	auto advance(std::size_t n) const -> Location
	{
		return Location{text, offset + n, depth};
	}

	auto deeper() const -> Location
	{
		return Location{text, offset, depth + 1};
	}

	auto remaining() const -> std::string_view
	{
		return std::string_view(*text).substr(offset);
	}

	bool at_end() const
	{
		return offset >= text->size();
	}

	auto consumed_since(const Location& start) const -> std::string_view;

	auto line() const -> std::size_t;
	auto column() const -> std::size_t;

	bool operator==(const Location& other) const
	{
		return text == other.text and offset == other.offset;
	}
};

std::ostream& operator<<(std::ostream& o, const Location& loc);
