// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SRED_INCLUDE_SRED_IOSTREAM_HPP
#define SRED_INCLUDE_SRED_IOSTREAM_HPP

#include <sred/grammar.hpp>
#include <sred/identifier.hpp>
#include <sred/lexer.hpp>

#include <cstdio>
#include <functional>
#include <iostream>
#include <iterator>
#include <string>

#ifndef SRED_NO_ISATTY
#ifdef _MSC_VER
#ifndef SRED_HAS_ISATTY_MSVC
#define SRED_HAS_ISATTY_MSVC
#endif
#else
#ifndef SRED_HAS_ISATTY_POSIX
#ifdef __has_include
#if __has_include(<unistd.h>)
#define SRED_HAS_ISATTY_POSIX
#endif
#endif
#endif
#endif
#endif // SRED_NO_ISATTY

#if defined SRED_HAS_ISATTY_MSVC
#include <io.h>
#elif defined SRED_HAS_ISATTY_POSIX
#include <unistd.h>
#endif

namespace sred {

[[nodiscard]] inline bool stdin_isatty() noexcept
{
#if defined SRED_HAS_ISATTY_MSVC
	return _isatty(_fileno(stdin)) != 0;
#elif defined SRED_HAS_ISATTY_POSIX
	return isatty(fileno(stdin)) != 0;
#else
	return false;
#endif
}

// Reads everything left in the stream. Sets failbit when nothing was read.
[[nodiscard]] inline std::string read_source(std::istream& input)
{
	std::string text;
	std::istream::sentry const sentry{input, true};
	if (!sentry)
		return text;
	text.assign(std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{});
	input.setstate(text.empty() ? (std::ios_base::eofbit | std::ios_base::failbit) : std::ios_base::eofbit);
	return text;
}

inline std::ostream& operator<<(std::ostream& os, identifier const& id)
{
	return os << '#' << id.scope << '.' << id.sequence;
}

inline std::ostream& operator<<(std::ostream& os, source_position const& pos)
{
	return os << pos.line << ':' << pos.column;
}

inline std::ostream& operator<<(std::ostream& os, diagnostic const& d)
{
	return os << d.position << ": " << d.message;
}

template <class Token> using token_printer = std::function<void(std::ostream&, Token const&)>;
using symbol_namer = std::function<std::string(identifier)>;

namespace detail {

template <class Token>
void print_tree(std::ostream& os, parse_tree<Token> const& tree, token_printer<Token> const& print_token, symbol_namer const& name_symbol, std::size_t indent)
{
	os << std::string(indent * 2, ' ');
	if (tree.is_leaf()) {
		print_token(os, tree.token());
		os << '\n';
		return;
	}
	if (name_symbol)
		os << name_symbol(tree.symbol());
	else
		os << tree.symbol();
	os << '\n';
	for (auto const& child : tree.children())
		detail::print_tree(os, child, print_token, name_symbol, indent + 1);
}

} // namespace detail

// One line per tree element, children indented beneath their node.
template <class Token>
std::ostream& print_tree(std::ostream& os, parse_tree<Token> const& tree, token_printer<Token> const& print_token, symbol_namer const& name_symbol = {})
{
	detail::print_tree(os, tree, print_token, name_symbol, 0);
	return os;
}

} // namespace sred

#endif
