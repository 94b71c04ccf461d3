// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include <sred/sred.hpp>

#include <iostream>

#undef NDEBUG
#include <cassert>

using namespace std::string_view_literals;

using outcome = sred::lexer_outcome<std::string>;

// Maximal run of ASCII letters
outcome word(std::string_view input)
{
	std::size_t const n = sred::detail::span_of(input, sred::detail::is_ascii_alpha);
	if (n == 0)
		return outcome::ignored();
	return outcome::success(std::string{input.substr(0, n)}, input.substr(n));
}

// Claims a lone 'x' as "X"
outcome letter_x(std::string_view input)
{
	if (input.front() != 'x')
		return outcome::ignored();
	return outcome::success("X", input.substr(1));
}

outcome bang(std::string_view input)
{
	if (input.front() != '!')
		return outcome::ignored();
	return outcome::failed("bang");
}

void test_outcomes()
{
	auto const s = outcome::success("tok", "rest"sv);
	assert(s.is_success() && !s.is_ignored() && !s.is_failed());
	assert(s.token() == "tok");
	assert(s.remainder() == "rest");

	auto const i = outcome::ignored();
	assert(i.is_ignored());

	auto const f = outcome::failed("oops");
	assert(f.is_failed());
	assert(f.message() == "oops");

	bool thrown = false;
	try {
		(void)i.token();
	} catch (sred::bad_outcome_access const&) {
		thrown = true;
	}
	assert(thrown);

	thrown = false;
	try {
		(void)s.message();
	} catch (sred::bad_outcome_access const&) {
		thrown = true;
	}
	assert(thrown);
}

void test_skips_unrecognized_bytes()
{
	auto lex = sred::lexer_builder<std::string>{}.add(word).build();
	assert(lex.size() == 1);
	auto const tokens = sred::tokenize(lex, "  ab 12 cd!");
	assert((tokens == std::vector<std::string>{"ab", "cd"}));
}

void test_empty_input_and_empty_lexer()
{
	auto lex = sred::lexer_builder<std::string>{}.add(word).build();
	auto stream = lex.stream("");
	assert(!stream.next());
	assert(stream.done() && !stream.failed());

	sred::lexer<std::string> none;
	assert(none.empty());
	assert(sred::tokenize(none, "abc def").empty());
}

void test_recognizer_order()
{
	auto first = sred::lexer_builder<std::string>{}.add(letter_x).add(word).build();
	assert((sred::tokenize(first, "xy") == std::vector<std::string>{"X", "y"}));

	auto second = sred::lexer_builder<std::string>{}.add(word).add(letter_x).build();
	assert((sred::tokenize(second, "xy") == std::vector<std::string>{"xy"}));

	std::vector<std::unique_ptr<sred::recognizer<std::string>>> chain;
	chain.push_back(std::make_unique<sred::function_recognizer<std::string, decltype(&letter_x)>>(&letter_x));
	chain.push_back(std::make_unique<sred::function_recognizer<std::string, decltype(&word)>>(&word));
	auto third = sred::lexer_builder<std::string>{}.add_all(std::move(chain)).build();
	assert(third.size() == 2);
	assert((sred::tokenize(third, "xy") == std::vector<std::string>{"X", "y"}));
}

void test_failure_ends_stream()
{
	auto lex = sred::lexer_builder<std::string>{}.add(word).add(bang).build();
	auto stream = lex.stream("ab !cd");

	auto first = stream.next();
	assert(first && first->has_token());
	assert(first->token() == "ab");
	assert((stream.last_range() == sred::source_range{0, 2}));

	auto second = stream.next();
	assert(second && second->has_error() && !*second);
	assert(second->error().message == "bang");
	assert(second->error().index == 3);
	assert((second->error().position == sred::source_position{1, 4}));
	assert(stream.failed());

	bool thrown = false;
	try {
		(void)second->token();
	} catch (sred::bad_result_access const&) {
		thrown = true;
	}
	assert(thrown);

	assert(!stream.next());
	assert(stream.remaining() == "!cd");
}

void test_tokenize_throws_lex_error()
{
	auto lex = sred::lexer_builder<std::string>{}.add(word).add(bang).build();
	bool thrown = false;
	try {
		(void)sred::tokenize(lex, "ab\ncd !");
	} catch (sred::lex_error const& e) {
		thrown = true;
		assert(e.diagnostic().index == 6);
		assert((e.diagnostic().position == sred::source_position{2, 4}));
		assert(std::string_view{e.what()} == "2:4: bang");
	}
	assert(thrown);
}

void test_iteration()
{
	auto lex = sred::lexer_builder<std::string>{}.add(word).add(bang).build();
	auto stream = lex.stream("one two ! three");
	std::vector<std::string> tokens;
	std::size_t errors = 0;
	for (auto const& item : stream) {
		if (item.has_token())
			tokens.push_back(item.token());
		else
			++errors;
	}
	assert((tokens == std::vector<std::string>{"one", "two"}));
	assert(errors == 1);
	assert(stream.failed());
}

void test_foreign_remainder()
{
	static constexpr std::string_view elsewhere = "zz";
	auto lex = sred::lexer_builder<std::string>{}
		.add([](std::string_view) { return outcome::success("?", elsewhere); })
		.build();
	auto stream = lex.stream("abc");
	bool thrown = false;
	try {
		(void)stream.next();
	} catch (sred::bad_remainder const&) {
		thrown = true;
	}
	assert(thrown);
	assert(stream.done());
	assert(!stream.next());
}

void test_stalled_recognizer()
{
	auto lex = sred::lexer_builder<std::string>{}
		.add([](std::string_view input) { return outcome::success("?", input); })
		.build();
	bool thrown = false;
	try {
		(void)sred::tokenize(lex, "abc");
	} catch (sred::stalled_recognizer_error const&) {
		thrown = true;
	}
	assert(thrown);
}

void test_reentrant_stream()
{
	sred::lexer<std::string>* self = nullptr;
	auto lex = sred::lexer_builder<std::string>{}
		.add([&self](std::string_view) {
			auto inner = self->stream("nested");
			(void)inner.next();
			return outcome::ignored();
		})
		.build();
	self = &lex;
	auto stream = lex.stream("abc");
	bool thrown = false;
	try {
		(void)stream.next();
	} catch (sred::reenterant_lex_error const&) {
		thrown = true;
	}
	assert(thrown);
	assert(stream.done());
}

void test_null_recognizer()
{
	sred::lexer_builder<std::string> builder;
	std::unique_ptr<sred::recognizer<std::string>> none;
	bool thrown = false;
	try {
		builder.add(std::move(none));
	} catch (sred::bad_recognizer const&) {
		thrown = true;
	}
	assert(thrown);
	assert(builder.size() == 0);
}

void test_positions()
{
	sred::lexer<std::string> lex;
	std::string_view const text = "ab\ncd\r\nef\rg\n\nh";
	auto stream = lex.stream(text);
	assert((stream.position_at(0) == sred::source_position{1, 1}));
	assert((stream.position_at(2) == sred::source_position{1, 3}));
	assert((stream.position_at(3) == sred::source_position{2, 1}));
	assert((stream.position_at(4) == sred::source_position{2, 2}));
	assert((stream.position_at(7) == sred::source_position{3, 1}));
	assert((stream.position_at(10) == sred::source_position{4, 1}));
	assert((stream.position_at(13) == sred::source_position{6, 1}));
	assert((stream.position_at(1) == sred::source_position{1, 2}));
	assert((stream.position() == sred::source_position{1, 1}));
}

void test_tab_and_utf8_columns()
{
	sred::lexer<std::string> lex;
	{
		auto stream = lex.stream("\tx");
		assert((stream.position_at(1) == sred::source_position{1, 9}));
	}
	{
		auto stream = lex.stream("ab\tx");
		assert((stream.position_at(3) == sred::source_position{1, 9}));
	}
	{
		auto stream = lex.stream("\xC3\xA9x");
		assert((stream.position_at(2) == sred::source_position{1, 2}));
	}

	auto narrow = sred::lexer_builder<std::string>{}.tab_width(4).tab_alignment(4).build();
	assert(narrow.tab_width() == 4 && narrow.tab_alignment() == 4);
	auto stream = narrow.stream("\tx");
	assert((stream.position_at(1) == sred::source_position{1, 5}));
}

int main()
{
	try {
		test_outcomes();
		test_skips_unrecognized_bytes();
		test_empty_input_and_empty_lexer();
		test_recognizer_order();
		test_failure_ends_stream();
		test_tokenize_throws_lex_error();
		test_iteration();
		test_foreign_remainder();
		test_stalled_recognizer();
		test_reentrant_stream();
		test_null_recognizer();
		test_positions();
		test_tab_and_utf8_columns();
	} catch (std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return -1;
	} catch (...) {
		std::cerr << "Unknown Error\n";
		return -1;
	}
	return 0;
}
