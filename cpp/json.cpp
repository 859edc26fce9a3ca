#include <charconv>
#include <cmath>
#include <iterator>
#include <string>

#include "json.hpp"
#include "json_grammar.hpp"
#include "matching.hpp"

auto parse(std::string_view s) -> JsonResult
{
	return run(json_document(), std::string(s));
}

auto escape(const std::string& str) -> std::string
{
	std::string buf;
	buf.reserve(str.length());
	for (auto ch: str)
	{
		switch (ch)
		{
			case '\"': buf += "\\\""; break;
			case '\\': buf += "\\\\"; break;
			case '\r': buf += "\\r"; break;
			case '\n': buf += "\\n"; break;
			case '\t': buf += "\\t"; break;
			case '\b': buf += "\\b"; break;
			case '\f': buf += "\\f"; break;
			default:
				if (static_cast<unsigned char>(ch) < 0x20)
				{
					char hex[2];
					const auto result = std::to_chars(std::begin(hex), std::end(hex), static_cast<unsigned>(ch), 16);
					buf += ch < 0x10 ? "\\u000" : "\\u00";
					buf.append(hex, result.ptr - hex);
				}
				else buf += ch;
		}
	}
	return buf;
}

std::ostream& operator<<(std::ostream& o, Null)
{
	return o << "null";
}

// Shortest text that reads back as the same double; JSON has no spelling
// for infinities or NaN, so those become null.
std::ostream& write_number(std::ostream& o, double num)
{
	if (not std::isfinite(num)) return o << "null";
	char buf[32];
	const auto result = std::to_chars(std::begin(buf), std::end(buf), num);
	return o.write(buf, result.ptr - buf);
}

std::ostream& operator<<(std::ostream& o, const Array& arr)
{
	o << '[';
	for (auto it = std::begin(arr); it != std::end(arr); ++it)
	{
		if (it != std::begin(arr)) o << ", ";
		o << *it;
	}
	o << ']';
	return o;
}

std::ostream& operator<<(std::ostream& o, const Object& obj)
{
	o << '{';
	for (auto it = std::begin(obj); it != std::end(obj); ++it)
	{
		auto& [key, value] = *it;
		if (it != std::begin(obj)) o << ", ";
		o << '"' << escape(key) << "\": " << value;
	}
	o << '}';
	return o;
}

std::ostream& operator<<(std::ostream& o, const Json& json)
{
	return match(json.value,
		[&](const std::string& str) -> std::ostream& {
			return o << '"' << escape(str) << '"';
		},
		[&](bool b) -> std::ostream& {
			return o << (b ? "true" : "false");
		},
		[&](double num) -> std::ostream& {
			return write_number(o, num);
		},
		[&](const auto& value) -> std::ostream& {
			return o << value;
		});
}
