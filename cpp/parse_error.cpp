#include "parse_error.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

ParseError::ParseError(Frame frame)
	: stack{std::move(frame)}
{
}

auto ParseError::push(Frame frame) const -> ParseError
{
	ParseError pushed = *this;
	pushed.stack.push_back(std::move(frame));
	return pushed;
}

auto ParseError::context() const -> std::vector<std::string>
{
	std::vector<std::string> labels;
	labels.reserve(stack.size() - 1);
	for (auto it = std::rbegin(stack); it != std::prev(std::rend(stack)); ++it)
	{
		labels.push_back(it->message);
	}
	return labels;
}

auto expected(const Location& loc, const std::string& what, Error code) -> ParseError
{
	if (loc.at_end())
	{
		const Error eof_code = code == Error::Mismatch ? Error::EndOfInput : code;
		return ParseError(Frame{loc, eof_code, "expected " + what + ", found end of input"});
	}
	return ParseError(Frame{loc, code, "expected " + what});
}

std::ostream& operator<<(std::ostream& o, const Error& error)
{
	switch (error)
	{
		case Error::Mismatch: return o << "Mismatch";
		case Error::EndOfInput: return o << "EndOfInput";
		case Error::InvalidEscape: return o << "InvalidEscape";
		case Error::InvalidNumber: return o << "InvalidNumber";
		case Error::ControlCharacter: return o << "ControlCharacter";
		case Error::Garbage: return o << "Garbage";
		case Error::NestingDepth: return o << "NestingDepth";
		case Error::Context: return o << "Context";
		case Error::Failure: return o << "Failure";
	}
	throw std::runtime_error("Invalid Error value");
}

std::ostream& operator<<(std::ostream& o, const ParseError& error)
{
	o << error.message() << " at " << error.location();
	const auto& frames = error.frames();
	if (frames.size() > 1)
	{
		o << " (while parsing " << frames[1].message;
		for (auto it = std::next(std::begin(frames), 2); it != std::end(frames); ++it)
		{
			o << " in " << it->message;
		}
		o << ')';
	}
	return o;
}
