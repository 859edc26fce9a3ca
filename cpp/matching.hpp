#pragma once

#include <utility>
#include <variant>

template<typename ...Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};
template<typename ...Fs> overloaded(Fs...) -> overloaded<Fs...>;

// Visits a variant with the given handlers. Pair alternatives, such as
// Ok<T> = (value, Location), are unpacked into two handler arguments.
template<typename ...Ts, typename ...Fs>
decltype(auto) match(std::variant<Ts...>&& v, Fs&&... f)
{
	auto overload = overloaded{std::forward<Fs>(f)...};
	auto unpair = [&]<typename First, typename Second>(std::pair<First, Second>&& p){return overload(std::move(p.first), std::move(p.second));};
	return std::visit(overloaded{unpair, overload}, std::move(v));
}
template<typename ...Ts, typename ...Fs>
decltype(auto) match(const std::variant<Ts...>& v, Fs&&... f)
{
	auto overload = overloaded{std::forward<Fs>(f)...};
	auto unpair = [&]<typename First, typename Second>(const std::pair<First, Second>& p){return overload(p.first, p.second);};
	return std::visit(overloaded{unpair, overload}, v);
}
