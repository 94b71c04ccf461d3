// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SRED_INCLUDE_SRED_DETAIL_HPP
#define SRED_INCLUDE_SRED_DETAIL_HPP

#include <algorithm>
#include <exception>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace sred::detail {

template <class Rng> using range_begin_t = std::decay_t<decltype(std::begin(std::declval<Rng&>()))>;
template <class Rng> using range_end_t = std::decay_t<decltype(std::end(std::declval<Rng&>()))>;

template <class Rng, class T, class = void> struct is_input_range_of_impl : std::false_type {};
template <class Rng, class T> struct is_input_range_of_impl<Rng, T, std::void_t<range_begin_t<Rng>, range_end_t<Rng>>>
	: std::integral_constant<bool,
		std::is_base_of_v<std::input_iterator_tag, typename std::iterator_traits<range_begin_t<Rng>>::iterator_category> &&
		std::is_convertible_v<typename std::iterator_traits<range_begin_t<Rng>>::reference, T>> {};
template <class Rng, class T> inline constexpr bool is_input_range_of_v = is_input_range_of_impl<Rng, T>::value;
template <class Rng, class T, class U = void> using enable_if_input_range_of_t = std::enable_if_t<is_input_range_of_v<Rng, T>, U>;

template <class T, class = void> struct is_equality_comparable : std::false_type {};
template <class T> struct is_equality_comparable<T, std::void_t<decltype(std::declval<T const&>() == std::declval<T const&>())>> : std::true_type {};
template <class T> inline constexpr bool is_equality_comparable_v = is_equality_comparable<T>::value;

template <class Error>
class reentrancy_sentinel
{
	std::reference_wrapper<bool> value_;

public:
	constexpr explicit reentrancy_sentinel(bool& x)
		: value_{x}
	{
		if (value_.get())
			throw Error();
		value_.get() = true;
	}

	~reentrancy_sentinel()
	{
		value_.get() = false;
	}

	reentrancy_sentinel(reentrancy_sentinel const&) = delete;
	reentrancy_sentinel(reentrancy_sentinel&&) = delete;
	reentrancy_sentinel& operator=(reentrancy_sentinel const&) = delete;
	reentrancy_sentinel& operator=(reentrancy_sentinel&&) = delete;
};

template <class EF>
class scope_fail
{
	static_assert(std::is_invocable_v<EF>);

	EF destructor_;
	int uncaught_on_construction_;

public:
	template <class Fn, class = std::enable_if_t<std::is_constructible_v<EF, Fn&&>>>
	constexpr explicit scope_fail( Fn&& fn ) noexcept(std::is_nothrow_constructible_v<EF, Fn&&>)
		: destructor_{std::forward<Fn>(fn)}
		, uncaught_on_construction_(std::uncaught_exceptions())
	{}

	~scope_fail()
	{
		if (std::uncaught_exceptions() > uncaught_on_construction_)
			destructor_();
	}

	scope_fail(scope_fail const&) = delete;
	scope_fail(scope_fail&&) = delete;
	scope_fail& operator=(scope_fail const&) = delete;
	scope_fail& operator=(scope_fail&&) = delete;
};

template <class Fn, class = std::enable_if_t<std::is_invocable_v<Fn>>>
scope_fail(Fn) -> scope_fail<std::decay_t<Fn>>;

template <class Sequence>
[[nodiscard]] constexpr auto pop_back(Sequence& s) -> typename Sequence::value_type
{
	typename Sequence::value_type result{std::move(s.back())}; // NOLINT(misc-const-correctness)
	s.pop_back();
	return result;
}

[[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept { return ((c >= 'A') && (c <= 'Z')) || ((c >= 'a') && (c <= 'z')); }
[[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept { return (c >= '0') && (c <= '9'); }
[[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept { return is_ascii_alpha(c) || is_ascii_digit(c); }
[[nodiscard]] constexpr char ascii_toupper(char c) noexcept { return ((c >= 'a') && (c <= 'z')) ? static_cast<char>(c - 'a' + 'A') : c; }

[[nodiscard]] constexpr bool ascii_iequal(std::string_view x, std::string_view y) noexcept
{
	if (x.size() != y.size())
		return false;
	for (std::size_t i = 0; i < x.size(); ++i)
		if (ascii_toupper(x[i]) != ascii_toupper(y[i]))
			return false;
	return true;
}

template <class Pred>
[[nodiscard]] constexpr std::size_t span_of(std::string_view s, Pred pred, std::size_t first = 0)
{
	std::size_t n = first;
	while ((n < s.size()) && pred(s[n]))
		++n;
	return n;
}

} // namespace sred::detail

#endif
