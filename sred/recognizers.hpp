// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SRED_INCLUDE_SRED_RECOGNIZERS_HPP
#define SRED_INCLUDE_SRED_RECOGNIZERS_HPP

#include <sred/lexer.hpp>

#include <charconv>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <system_error>
#include <utility>

namespace sred {

// Closed set of case-insensitive words. Reads the maximal run of ASCII letters
// and claims it only if the whole run is one of the words.
template <class Token>
class keyword_recognizer final : public recognizer<Token>
{
	std::vector<std::pair<std::string, Token>> keywords_;

public:
	keyword_recognizer() = default;
	keyword_recognizer(std::initializer_list<std::pair<std::string, Token>> keywords) : keywords_{keywords} {}
	keyword_recognizer& add(std::string word, Token token) { keywords_.emplace_back(std::move(word), std::move(token)); return *this; }
	[[nodiscard]] std::size_t size() const noexcept { return keywords_.size(); }

	[[nodiscard]] lexer_outcome<Token> recognize(std::string_view input) override
	{
		std::size_t const n = detail::span_of(input, detail::is_ascii_alpha);
		if (n == 0)
			return lexer_outcome<Token>::ignored();
		std::string_view const word = input.substr(0, n);
		for (auto const& [keyword, token] : keywords_)
			if (detail::ascii_iequal(word, keyword))
				return lexer_outcome<Token>::success(token, input.substr(n));
		return lexer_outcome<Token>::ignored();
	}
};

// Letter followed by any run of letters and digits.
template <class Token>
class identifier_recognizer final : public recognizer<Token>
{
	std::function<Token(std::string_view)> make_;

public:
	explicit identifier_recognizer(std::function<Token(std::string_view)> make) : make_{std::move(make)} {}

	[[nodiscard]] lexer_outcome<Token> recognize(std::string_view input) override
	{
		if (!detail::is_ascii_alpha(input.front()))
			return lexer_outcome<Token>::ignored();
		std::size_t const n = detail::span_of(input, detail::is_ascii_alnum, 1);
		return lexer_outcome<Token>::success(make_(input.substr(0, n)), input.substr(n));
	}
};

template <class Token, class Integer = std::uint64_t>
class integer_recognizer final : public recognizer<Token>
{
	static_assert(std::is_integral_v<Integer>, "Integer must be an integral type");
	std::function<Token(Integer)> make_;

public:
	explicit integer_recognizer(std::function<Token(Integer)> make) : make_{std::move(make)} {}

	[[nodiscard]] lexer_outcome<Token> recognize(std::string_view input) override
	{
		std::size_t const n = detail::span_of(input, detail::is_ascii_digit);
		if (n == 0)
			return lexer_outcome<Token>::ignored();
		Integer value{0};
		auto const [ptr, ec] = std::from_chars(input.data(), input.data() + n, value);
		if (ec == std::errc::result_out_of_range)
			return lexer_outcome<Token>::failed("integer literal out of range: " + std::string{input.substr(0, n)});
		if ((ec != std::errc{}) || (ptr != input.data() + n))
			return lexer_outcome<Token>::failed("invalid integer literal: " + std::string{input.substr(0, n)});
		return lexer_outcome<Token>::success(make_(value), input.substr(n));
	}
};

// Text between a pair of quote characters, quotes excluded. No escapes.
template <class Token>
class quoted_recognizer final : public recognizer<Token>
{
	std::function<Token(std::string_view)> make_;
	char quote_;

public:
	explicit quoted_recognizer(std::function<Token(std::string_view)> make, char quote = '"') : make_{std::move(make)}, quote_{quote} {}
	[[nodiscard]] char quote() const noexcept { return quote_; }

	[[nodiscard]] lexer_outcome<Token> recognize(std::string_view input) override
	{
		if (input.front() != quote_)
			return lexer_outcome<Token>::ignored();
		std::size_t const close = input.find(quote_, 1);
		if (close == std::string_view::npos)
			return lexer_outcome<Token>::failed("unterminated string literal");
		return lexer_outcome<Token>::success(make_(input.substr(1, close - 1)), input.substr(close + 1));
	}
};

// Single characters looked up in a fixed table.
template <class Token>
class char_recognizer final : public recognizer<Token>
{
	std::vector<std::pair<char, Token>> table_;

public:
	char_recognizer() = default;
	char_recognizer(std::initializer_list<std::pair<char, Token>> table) : table_{table} {}
	char_recognizer& add(char c, Token token) { table_.emplace_back(c, std::move(token)); return *this; }

	[[nodiscard]] lexer_outcome<Token> recognize(std::string_view input) override
	{
		for (auto const& [c, token] : table_)
			if (input.front() == c)
				return lexer_outcome<Token>::success(token, input.substr(1));
		return lexer_outcome<Token>::ignored();
	}
};

// Single character accepted by a predicate.
template <class Token>
class class_recognizer final : public recognizer<Token>
{
	std::function<bool(char)> accept_;
	std::function<Token(char)> make_;

public:
	class_recognizer(std::function<bool(char)> accept, std::function<Token(char)> make) : accept_{std::move(accept)}, make_{std::move(make)} {}

	[[nodiscard]] lexer_outcome<Token> recognize(std::string_view input) override
	{
		if (!accept_(input.front()))
			return lexer_outcome<Token>::ignored();
		return lexer_outcome<Token>::success(make_(input.front()), input.substr(1));
	}
};

} // namespace sred

#endif
