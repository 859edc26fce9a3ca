#include "json_grammar.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

bool is_ws(char c)
{
	switch (c)
	{
		case ' ':
		case '\t':
		case '\n':
		case '\r':
			return true;
		default:
			return false;
	}
}

bool is_digit(char ch)
{
	switch (ch)
	{
		case '0'...'9': return true;
		default: return false;
	}
}

bool is_nonzero_digit(char ch)
{
	switch (ch)
	{
		case '1'...'9': return true;
		default: return false;
	}
}

bool is_hex(char ch)
{
	switch (ch)
	{
		case '0'...'9': return true;
		case 'a'...'f': return true;
		case 'A'...'F': return true;
		default: return false;
	}
}

bool is_sign(char ch)
{
	return ch == '+' or ch == '-';
}

bool is_exponent_marker(char ch)
{
	return ch == 'e' or ch == 'E';
}

bool is_control(char ch)
{
	return static_cast<unsigned char>(ch) < 0x20;
}

bool is_unescaped(char ch)
{
	return ch != '"' and ch != '\\' and not is_control(ch);
}

bool is_simple_escape(char ch)
{
	switch (ch)
	{
		case '"':
		case '\\':
		case '/':
		case 'b':
		case 'f':
		case 'n':
		case 'r':
		case 't':
			return true;
		default:
			return false;
	}
}

char unescape(char ch)
{
	switch (ch)
	{
		case 'b': return '\b';
		case 'f': return '\f';
		case 'n': return '\n';
		case 'r': return '\r';
		case 't': return '\t';
		default: return ch;
	}
}

bool is_high_surrogate(std::uint32_t unit)
{
	return unit >= 0xD800 and unit <= 0xDBFF;
}

bool is_low_surrogate(std::uint32_t unit)
{
	return unit >= 0xDC00 and unit <= 0xDFFF;
}

auto utf8(std::uint32_t cp) -> std::string
{
	std::string out;
	if (cp < 0x80)
	{
		out += static_cast<char>(cp);
	}
	else if (cp < 0x800)
	{
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
	else if (cp < 0x10000)
	{
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
	else
	{
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
	return out;
}

auto join(std::vector<std::string> pieces) -> std::string
{
	std::string out;
	for (const auto& piece: pieces) out += piece;
	return out;
}

auto whitespace() -> Parser<Unit>
{
	return ignore(many(char_class(is_ws, "whitespace")));
}

auto json_null() -> Parser<Json>
{
	return map(literal("null"), [](std::string) { return null(); });
}

auto json_bool() -> Parser<Json>
{
	return or_else(
		map(literal("true"), [](std::string) { return True(); }),
		map(literal("false"), [](std::string) { return False(); }));
}

auto digits() -> Parser<std::string>
{
	return slice(many1(char_class(is_digit, "digit")));
}

auto integer_part() -> Parser<Unit>
{
	auto leading_digit = commit(not_followed_by(char_class(is_digit, "digit"), Error::InvalidNumber, "leading zeros are not allowed"));
	auto zero = skip_left(literal("0"), leading_digit);
	auto nonzero = ignore(skip_left(char_class(is_nonzero_digit, "digit"), many(char_class(is_digit, "digit"))));
	return or_else(zero, nonzero);
}

auto fraction() -> Parser<std::string>
{
	return skip_left(literal("."), commit(expect("digit after decimal point", digits(), Error::InvalidNumber)));
}

auto exponent() -> Parser<std::string>
{
	auto sign = maybe(char_class(is_sign, "sign"));
	auto magnitude = skip_left(sign, expect("digit in exponent", digits(), Error::InvalidNumber));
	return skip_left(char_class(is_exponent_marker, "exponent"), commit(magnitude));
}

auto number_text() -> Parser<std::string>
{
	auto negative = skip_left(literal("-"), commit(expect("digit after '-'", integer_part(), Error::InvalidNumber)));
	auto mantissa = or_else(negative, expect("digit", integer_part(), Error::InvalidNumber));
	return slice(skip_left(mantissa, skip_left(maybe(fraction()), maybe(exponent()))));
}

// Power of ten of the leading significant digit: 120 gives 2, 0.05 gives -2.
auto decimal_magnitude(std::string_view text) -> long long
{
	constexpr long long unbounded = std::numeric_limits<long long>::max() / 2;
	long long power = 0;
	const auto marker = text.find_first_of("eE");
	if (marker != std::string_view::npos)
	{
		auto written = text.substr(marker + 1);
		const bool negative = written.front() == '-';
		if (is_sign(written.front())) written.remove_prefix(1);
		const auto [end, ec] = std::from_chars(written.data(), written.data() + written.size(), power);
		if (ec == std::errc::result_out_of_range) power = unbounded;
		if (negative) power = -power;
	}
	auto mantissa = text.substr(0, marker);
	if (mantissa.front() == '-') mantissa.remove_prefix(1);
	const auto point = std::min(mantissa.find('.'), mantissa.size());
	const auto first = mantissa.find_first_not_of("0.");
	if (first == std::string_view::npos) return -unbounded;
	const auto position = first < point
		? static_cast<long long>(point - first - 1)
		: -static_cast<long long>(first - point);
	return power + position;
}

// Overflow is an error; values too small for a double round to zero.
auto to_double(const std::string& text) -> std::optional<double>
{
	double value = 0;
	const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec == std::errc::result_out_of_range and decimal_magnitude(text) < 0)
	{
		return text.front() == '-' ? -0.0 : 0.0;
	}
	if (ec != std::errc{} or end != text.data() + text.size()) return std::nullopt;
	return value;
}

// Range errors are reported at the start of the number.
auto json_number() -> Parser<Json>
{
	return Parser<Json>([text = number_text()](const Location& loc) -> Result<Json> {
		auto r = text(loc);
		if (auto* e = std::get_if<Err>(&r)) return std::move(*e);
		auto& [number, next] = std::get<Ok<std::string>>(r);
		const auto value = to_double(number);
		if (not value)
		{
			return Err{ParseError(Frame{loc, Error::InvalidNumber, "number out of range: " + number}), true};
		}
		return ok(Json{*value}, std::move(next));
	});
}

auto hex_quad() -> Parser<std::uint32_t>
{
	auto hex_digit = expect("hexadecimal digit", char_class(is_hex, "hexadecimal digit"), Error::InvalidEscape);
	return map(slice(count(4, hex_digit)), [](std::string quad) {
		return static_cast<std::uint32_t>(std::stoul(quad, nullptr, 16));
	});
}

auto low_surrogate() -> Parser<std::uint32_t>
{
	auto marker = expect("'\\u' escape for the low surrogate", literal("\\u"), Error::InvalidEscape);
	return flat_map(skip_left(marker, hex_quad()), [](std::uint32_t unit) {
		if (is_low_surrogate(unit)) return succeed(unit);
		return fail<std::uint32_t>(Error::InvalidEscape, "expected low surrogate");
	});
}

auto unicode_escape() -> Parser<std::string>
{
	auto scalar = flat_map(hex_quad(), [](std::uint32_t unit) {
		if (is_low_surrogate(unit)) return fail<std::string>(Error::InvalidEscape, "unpaired low surrogate");
		if (not is_high_surrogate(unit)) return succeed(utf8(unit));
		return map(low_surrogate(), [unit](std::uint32_t low) {
			return utf8(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
		});
	});
	return skip_left(literal("u"), commit(scalar));
}

auto simple_escape() -> Parser<std::string>
{
	return map(char_class(is_simple_escape, "escape character"), [](char ch) {
		return std::string(1, unescape(ch));
	});
}

auto escape_sequence() -> Parser<std::string>
{
	auto sequence = expect("escape sequence", or_else(simple_escape(), unicode_escape()), Error::InvalidEscape);
	return skip_left(literal("\\"), commit(sequence));
}

auto unescaped_run() -> Parser<std::string>
{
	return slice(many1(char_class(is_unescaped, "string character")));
}

auto closing_quote() -> Parser<std::string>
{
	auto control = char_class(is_control, "control character");
	return skip_left(not_followed_by(control, Error::ControlCharacter, "unescaped control character in string"), literal("\""));
}

auto string_literal() -> Parser<std::string>
{
	auto body = map(many(or_else(unescaped_run(), escape_sequence())), join);
	return skip_left(literal("\""), commit(skip_right(body, closing_quote())));
}

auto json_string() -> Parser<Json>
{
	return map(string_literal(), [](std::string s) { return Json{std::move(s)}; });
}

// Items after a comma are committed: a trailing comma is reported at the
// missing item instead of backtracking to the closing bracket.
template<typename A>
auto comma_separated(const Parser<A>& item) -> Parser<std::vector<A>>
{
	return map2(item, many(skip_left(token(literal(",")), commit(item))), prepend<A>);
}

auto json_array() -> Parser<Json>
{
	auto close = literal("]");
	auto items = skip_right(comma_separated(lazy(json_value)), expect("',' or ']'", close));
	auto empty = map(close, [](std::string) { return Array{}; });
	auto body = map(or_else(items, empty), [](Array elements) { return Json{std::move(elements)}; });
	return label("array", skip_left(token(literal("[")), commit(nested(max_depth, body))));
}

using Member = std::pair<std::string, Json>;

// The key labels any failure in the rest of the member, which is committed
// once the key has been read.
auto member() -> Parser<Member>
{
	auto key = token(expect("object key", string_literal()));
	auto value = skip_left(token(literal(":")), lazy(json_value));
	return Parser<Member>([key, value](const Location& loc) -> Result<Member> {
		auto rk = key(loc);
		if (auto* e = std::get_if<Err>(&rk)) return std::move(*e);
		auto& [name, after_key] = std::get<Ok<std::string>>(rk);
		auto rv = value(after_key);
		if (auto* e = std::get_if<Err>(&rv))
		{
			const Frame context{after_key, Error::Context, "value for key \"" + escape(name) + "\""};
			return Err{e->error.push(context), true};
		}
		auto& [v, next] = std::get<Ok<Json>>(rv);
		return ok(Member{std::move(name), std::move(v)}, std::move(next));
	});
}

auto to_object(std::vector<Member> members) -> Json
{
	Object obj;
	obj.reserve(members.size());
	for (auto& [key, value]: members)
	{
		obj.insert_or_assign(std::move(key), std::move(value));
	}
	return Json{std::move(obj)};
}

auto json_object() -> Parser<Json>
{
	auto close = literal("}");
	auto members = skip_right(comma_separated(member()), expect("',' or '}'", close));
	auto empty = map(close, [](std::string) { return std::vector<Member>{}; });
	auto body = map(or_else(members, empty), to_object);
	return label("object", skip_left(token(literal("{")), commit(nested(max_depth, body))));
}

auto json_value() -> const Parser<Json>&
{
	static const Parser<Json> value = [] {
		auto alternatives = choice(json_null(), json_bool(), json_number(), json_string(), json_array(), json_object());
		return skip_left(whitespace(), skip_right(expect("value", alternatives), whitespace()));
	}();
	return value;
}

auto json_document() -> const Parser<Json>&
{
	static const Parser<Json> document = skip_right(json_value(), eof());
	return document;
}
