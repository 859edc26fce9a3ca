#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "parser.hpp"
#include "primitives.hpp"

template<typename A, typename F>
auto map(const Parser<A>& p, F f) -> Parser<std::invoke_result_t<F, A>>
{
	using B = std::invoke_result_t<F, A>;
	return Parser<B>([p, f](const Location& loc) {
		return match(p(loc),
			[&](A&& value, Location next) {
				return ok<B>(f(std::move(value)), std::move(next));
			},
			[](Err&& e) {
				return Result<B>{std::move(e)};
			});
	});
}

// Runs p, then the parser f builds from its value, from where p stopped.
template<typename A, typename F>
auto flat_map(const Parser<A>& p, F f) -> std::decay_t<std::invoke_result_t<F, A>>
{
	using PB = std::decay_t<std::invoke_result_t<F, A>>;
	using B = typename PB::value_type;
	return PB([p, f](const Location& loc) {
		return match(p(loc),
			[&](A&& value, Location next) {
				return attempt(f(std::move(value)), next);
			},
			[](Err&& e) {
				return Result<B>{std::move(e)};
			});
	});
}

template<typename A, typename B, typename F>
auto map2(const Parser<A>& pa, const Parser<B>& pb, F f) -> Parser<std::invoke_result_t<F, A, B>>
{
	using C = std::invoke_result_t<F, A, B>;
	return Parser<C>([pa, pb, f](const Location& loc) -> Result<C> {
		auto ra = pa(loc);
		if (auto* e = std::get_if<Err>(&ra)) return std::move(*e);
		auto& [a, middle] = std::get<Ok<A>>(ra);
		auto rb = pb(middle);
		if (auto* e = std::get_if<Err>(&rb)) return std::move(*e);
		auto& [b, end] = std::get<Ok<B>>(rb);
		return ok<C>(f(std::move(a), std::move(b)), std::move(end));
	});
}

template<typename A, typename B>
auto product(const Parser<A>& pa, const Parser<B>& pb) -> Parser<std::pair<A, B>>
{
	return map2(pa, pb, [](A a, B b) {
		return std::pair<A, B>{std::move(a), std::move(b)};
	});
}

template<typename A, typename B>
auto skip_left(const Parser<A>& pa, const Parser<B>& pb) -> Parser<B>
{
	return map2(pa, pb, [](A, B b) { return b; });
}

template<typename A, typename B>
auto skip_right(const Parser<A>& pa, const Parser<B>& pb) -> Parser<A>
{
	return map2(pa, pb, [](A a, B) { return a; });
}

template<typename A>
auto ignore(const Parser<A>& p) -> Parser<Unit>
{
	return map(p, [](A) { return Unit{}; });
}

// Tries p1 and, unless it failed committed, p2 from the same location.
// When both fail the error anchored further into the input is reported;
// ties go to p1.
template<typename A>
auto or_else(const Parser<A>& p1, const Parser<A>& p2) -> Parser<A>
{
	return Parser<A>([p1, p2](const Location& loc) -> Result<A> {
		auto first = p1(loc);
		const auto* e1 = std::get_if<Err>(&first);
		if (e1 == nullptr or e1->committed) return first;
		auto second = p2(loc);
		const auto* e2 = std::get_if<Err>(&second);
		if (e2 == nullptr or e2->committed) return second;
		if (e2->error.offset() > e1->error.offset()) return second;
		return first;
	});
}

template<typename A, typename ...Ps>
auto choice(const Parser<A>& first, const Ps&... rest) -> Parser<A>
{
	if constexpr (sizeof...(rest) == 0) return first;
	else return or_else(first, choice(rest...));
}

template<typename A>
auto commit(const Parser<A>& p) -> Parser<A>
{
	return Parser<A>([p](const Location& loc) {
		auto r = p(loc);
		if (auto* e = std::get_if<Err>(&r)) e->committed = true;
		return r;
	});
}

template<typename A>
auto many(const Parser<A>& p) -> Parser<std::vector<A>>
{
	return Parser<std::vector<A>>([p](const Location& loc) -> Result<std::vector<A>> {
		std::vector<A> items;
		Location cursor = loc;
		while (true)
		{
			auto r = p(cursor);
			if (auto* e = std::get_if<Err>(&r))
			{
				if (e->committed) return std::move(*e);
				return ok(std::move(items), std::move(cursor));
			}
			auto& [value, next] = std::get<Ok<A>>(r);
			if (next.offset == cursor.offset)
			{
				throw GrammarError("many: repeated parser succeeded without consuming input at offset " + std::to_string(cursor.offset));
			}
			items.push_back(std::move(value));
			cursor = std::move(next);
		}
	});
}

template<typename A>
auto prepend(A head, std::vector<A> tail) -> std::vector<A>
{
	tail.insert(std::begin(tail), std::move(head));
	return tail;
}

template<typename A>
auto many1(const Parser<A>& p) -> Parser<std::vector<A>>
{
	return map2(p, many(p), prepend<A>);
}

// Exactly n repetitions of p.
template<typename A>
auto count(std::size_t n, const Parser<A>& p) -> Parser<std::vector<A>>
{
	return Parser<std::vector<A>>([n, p](const Location& loc) -> Result<std::vector<A>> {
		std::vector<A> items;
		items.reserve(n);
		Location cursor = loc;
		for (std::size_t i = 0; i < n; ++i)
		{
			auto r = p(cursor);
			if (auto* e = std::get_if<Err>(&r)) return std::move(*e);
			auto& [value, next] = std::get<Ok<A>>(r);
			items.push_back(std::move(value));
			cursor = std::move(next);
		}
		return ok(std::move(items), std::move(cursor));
	});
}

template<typename A>
auto maybe(const Parser<A>& p) -> Parser<std::optional<A>>
{
	auto some = map(p, [](A value) { return std::optional<A>(std::move(value)); });
	return or_else(some, succeed(std::optional<A>{}));
}

template<typename A, typename S>
auto sep_by1(const Parser<A>& p, const Parser<S>& separator) -> Parser<std::vector<A>>
{
	return map2(p, many(skip_left(separator, p)), prepend<A>);
}

template<typename A, typename S>
auto sep_by(const Parser<A>& p, const Parser<S>& separator) -> Parser<std::vector<A>>
{
	return or_else(sep_by1(p, separator), succeed(std::vector<A>{}));
}

// On failure adds an outer frame naming what was being parsed.
template<typename A>
auto label(std::string description, const Parser<A>& p) -> Parser<A>
{
	return Parser<A>([description = std::move(description), p](const Location& loc) {
		auto r = p(loc);
		if (auto* e = std::get_if<Err>(&r))
		{
			e->error = e->error.push(Frame{loc, Error::Context, description});
		}
		return r;
	});
}

// Replaces an uncommitted failure that did not get past the starting point
// with a single "expected <description>" frame.
template<typename A>
auto expect(std::string description, const Parser<A>& p, Error code = Error::Mismatch) -> Parser<A>
{
	return Parser<A>([description = std::move(description), p, code](const Location& loc) {
		auto r = p(loc);
		if (auto* e = std::get_if<Err>(&r); e != nullptr and not e->committed and e->error.offset() == loc.offset)
		{
			e->error = expected(loc, description, code);
		}
		return r;
	});
}

template<typename A>
auto slice(const Parser<A>& p) -> Parser<std::string>
{
	return Parser<std::string>([p](const Location& loc) {
		return match(p(loc),
			[&](A&&, Location next) {
				auto text = std::string(next.consumed_since(loc));
				return ok(std::move(text), std::move(next));
			},
			[](Err&& e) {
				return Result<std::string>{std::move(e)};
			});
	});
}

// Succeeds without consuming input when p fails; fails at the current
// location when p would match.
template<typename A>
auto not_followed_by(const Parser<A>& p, Error code, std::string message) -> Parser<Unit>
{
	return Parser<Unit>([p, code, message = std::move(message)](const Location& loc) {
		if (std::holds_alternative<Err>(p(loc))) return ok(Unit{}, loc);
		return err<Unit>(ParseError(Frame{loc, code, message}));
	});
}

// Runs p one nesting level deeper. Opening a level when limit levels are
// already open fails committed, which bounds the recursion of a rule.
template<typename A>
auto nested(std::size_t limit, const Parser<A>& p) -> Parser<A>
{
	return Parser<A>([limit, p](const Location& loc) -> Result<A> {
		if (loc.depth >= limit)
		{
			return Err{ParseError(Frame{loc, Error::NestingDepth, "maximum nesting depth of " + std::to_string(limit) + " exceeded"}), true};
		}
		auto r = p(loc.deeper());
		if (auto* done = std::get_if<Ok<A>>(&r)) done->second.depth = loc.depth;
		return r;
	});
}

// Defers building the parser until it runs, which lets rules refer to
// themselves.
template<typename F>
auto lazy(F thunk) -> std::decay_t<std::invoke_result_t<F>>
{
	using P = std::decay_t<std::invoke_result_t<F>>;
	return P([thunk](const Location& loc) {
		return attempt(thunk(), loc);
	});
}
