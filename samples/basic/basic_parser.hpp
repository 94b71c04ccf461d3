// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

// Tiny BASIC front-end, line oriented
// https://en.wikipedia.org/wiki/Tiny_BASIC#Formal_grammar

#ifndef SRED_SAMPLES_BASIC_BASIC_PARSER_HPP
#define SRED_SAMPLES_BASIC_BASIC_PARSER_HPP

#include <sred/sred.hpp>
#include <sred/iostream.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace basic {

enum class keyword : std::uint_least8_t { print, if_, then, goto_, input, let, gosub, return_, clear, list, run, end };
enum class punctuator : std::uint_least8_t { less, greater, equals, plus, minus, times, divide, comma };

inline constexpr std::array<std::string_view, 12> keyword_names{"PRINT", "IF", "THEN", "GOTO", "INPUT", "LET", "GOSUB", "RETURN", "CLEAR", "LIST", "RUN", "END"};
inline constexpr std::string_view punctuator_chars{"<>=+-*/,"};

// Single letter variable, A through Z stored as 0 through 25
struct variable
{
	std::uint_least8_t index{0};
	[[nodiscard]] char name() const noexcept { return static_cast<char>('A' + index); }
	[[nodiscard]] friend bool operator==(variable const& x, variable const& y) noexcept { return x.index == y.index; }
	[[nodiscard]] friend bool operator!=(variable const& x, variable const& y) noexcept { return x.index != y.index; }
};

struct newline
{
	[[nodiscard]] friend bool operator==(newline const&, newline const&) noexcept { return true; }
	[[nodiscard]] friend bool operator!=(newline const&, newline const&) noexcept { return false; }
};

using number = std::uint64_t;

struct token
{
	std::variant<keyword, variable, number, std::string, punctuator, newline> value;

	template <class T> [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(value); }
	template <class T> [[nodiscard]] T const& as() const { return std::get<T>(value); }
	[[nodiscard]] friend bool operator==(token const& x, token const& y) { return x.value == y.value; }
	[[nodiscard]] friend bool operator!=(token const& x, token const& y) { return x.value != y.value; }
};

template <class T>
[[nodiscard]] bool holds(token const& t) noexcept
{
	return t.is<T>();
}

inline std::ostream& operator<<(std::ostream& os, token const& t)
{
	std::visit([&os](auto const& v) {
		using T = std::decay_t<decltype(v)>;
		if constexpr (std::is_same_v<T, keyword>)
			os << "KEYWORD(" << keyword_names[static_cast<std::size_t>(v)] << ")";
		else if constexpr (std::is_same_v<T, variable>)
			os << "VAR(" << v.name() << ")";
		else if constexpr (std::is_same_v<T, number>)
			os << "NUMBER(" << v << ")";
		else if constexpr (std::is_same_v<T, std::string>)
			os << "STRING(\"" << v << "\")";
		else if constexpr (std::is_same_v<T, punctuator>)
			os << "SYMBOL(" << punctuator_chars[static_cast<std::size_t>(v)] << ")";
		else
			os << "NEWLINE";
	}, t.value);
	return os;
}

// Recognizers are tried in this order: strings, keywords, symbols, numbers,
// variables, newlines. Anything else, such as blanks, is skipped.
[[nodiscard]] inline sred::lexer<token> make_lexer()
{
	auto keywords = std::make_unique<sred::keyword_recognizer<token>>();
	for (std::size_t i = 0; i < keyword_names.size(); ++i)
		keywords->add(std::string{keyword_names[i]}, token{static_cast<keyword>(i)});

	auto symbols = std::make_unique<sred::char_recognizer<token>>();
	for (std::size_t i = 0; i < punctuator_chars.size(); ++i)
		symbols->add(punctuator_chars[i], token{static_cast<punctuator>(i)});

	sred::lexer_builder<token> builder;
	builder.emplace<sred::quoted_recognizer<token>>([](std::string_view s) { return token{std::string{s}}; });
	builder.add(std::move(keywords));
	builder.add(std::move(symbols));
	builder.emplace<sred::integer_recognizer<token>>([](number n) { return token{n}; });
	builder.emplace<sred::class_recognizer<token>>(
		[](char c) { return sred::detail::is_ascii_alpha(c); },
		[](char c) { return token{variable{static_cast<std::uint_least8_t>(sred::detail::ascii_toupper(c) - 'A')}}; });
	builder.emplace<sred::char_recognizer<token>>(std::initializer_list<std::pair<char, token>>{{'\n', token{newline{}}}});
	return builder.build();
}

struct basic_grammar
{
	sred::identifier line;
	sred::identifier statement;
	sred::grammar<token> rules;

	[[nodiscard]] std::string name_of(sred::identifier id) const
	{
		if (id == line)
			return "line";
		if (id == statement)
			return "statement";
		return "symbol";
	}
};

// line      ::= number statement NEWLINE
// statement ::= PRINT string | statement , string | statement , var
//             | INPUT var | GOTO number | GOSUB number | LET var = number
//             | RETURN | CLEAR | LIST | RUN | END
[[nodiscard]] inline basic_grammar make_grammar()
{
	sred::grammar_builder<token> builder;
	auto const line = builder.issue_symbol();
	auto const statement = builder.issue_symbol();
	auto const kw = [](keyword k) { return token{k}; };
	auto const sym = [](punctuator p) { return token{p}; };

	builder.add_rule(builder.rule(line).with_terminal(holds<number>).with_nonterminal(statement).with_terminal(holds<newline>).build());
	builder.add_rule(builder.rule(statement).with_literal(kw(keyword::print)).with_terminal(holds<std::string>).build());
	builder.add_rule(builder.rule(statement).with_nonterminal(statement).with_literal(sym(punctuator::comma)).with_terminal(holds<std::string>).build());
	builder.add_rule(builder.rule(statement).with_nonterminal(statement).with_literal(sym(punctuator::comma)).with_terminal(holds<variable>).build());
	builder.add_rule(builder.rule(statement).with_literal(kw(keyword::input)).with_terminal(holds<variable>).build());
	builder.add_rule(builder.rule(statement).with_literal(kw(keyword::goto_)).with_terminal(holds<number>).build());
	builder.add_rule(builder.rule(statement).with_literal(kw(keyword::gosub)).with_terminal(holds<number>).build());
	builder.add_rule(builder.rule(statement).with_literal(kw(keyword::let)).with_terminal(holds<variable>).with_literal(sym(punctuator::equals)).with_terminal(holds<number>).build());
	for (auto const k : {keyword::return_, keyword::clear, keyword::list, keyword::run, keyword::end})
		builder.add_rule(builder.rule(statement).with_literal(kw(k)).build());

	auto rules = std::move(builder).build();
	return basic_grammar{line, statement, std::move(*rules)};
}

// Parses a program one line at a time, finishing the reducer at every
// newline. A missing final newline is supplied.
[[nodiscard]] inline std::vector<std::optional<sred::parse_tree<token>>> parse_program(std::string_view text, sred::lexer<token>& lex, sred::basic_reducer<token>& reducer)
{
	std::vector<std::optional<sred::parse_tree<token>>> lines;
	reducer.reset();
	auto stream = lex.stream(text);
	while (auto item = stream.next()) {
		if (item->has_error())
			throw sred::lex_error{item->error()};
		bool const eol = item->token().is<newline>();
		reducer.push(std::move(*item).token());
		if (eol)
			lines.push_back(reducer.finish());
	}
	if (reducer.depth() != 0) {
		reducer.push(token{newline{}});
		lines.push_back(reducer.finish());
	}
	return lines;
}

} // namespace basic

#endif
