#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "location.hpp"

enum class Error
{
	Mismatch,
	EndOfInput,
	InvalidEscape,
	InvalidNumber,
	ControlCharacter,
	Garbage,
	NestingDepth,
	Context,
	Failure,
};

struct Frame
{
	Location location;
	Error error;
	std::string message;
};

// Stack of frames, innermost failure first, outer context labels after it.
class ParseError
{
public:
	explicit ParseError(Frame frame);

	auto push(Frame frame) const -> ParseError;

	auto deepest() const -> const Frame& { return stack.front(); }
	auto frames() const -> const std::vector<Frame>& { return stack; }
	auto context() const -> std::vector<std::string>;

	auto location() const -> const Location& { return deepest().location; }
	auto offset() const -> std::size_t { return deepest().location.offset; }
	auto line() const -> std::size_t { return deepest().location.line(); }
	auto column() const -> std::size_t { return deepest().location.column(); }
	auto code() const -> Error { return deepest().error; }
	auto message() const -> const std::string& { return deepest().message; }

private:
	std::vector<Frame> stack;
};

// One-frame error for a failed expectation; at end of input the frame is
// reported as EndOfInput unless a more specific code is given.
auto expected(const Location& loc, const std::string& what, Error code = Error::Mismatch) -> ParseError;

std::ostream& operator<<(std::ostream& o, const Error& error);
std::ostream& operator<<(std::ostream& o, const ParseError& error);
