// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include <sred/sred.hpp>

#include <iostream>

#undef NDEBUG
#include <cassert>

using tree = sred::parse_tree<char>;

bool is_digit(char const& c) { return sred::detail::is_ascii_digit(c); }

void test_terminal_matching()
{
	sred::grammar_builder<char> g;
	auto const s = g.issue_symbol();
	auto const r = g.rule(s).with_literal('a').with_terminal(is_digit).build();
	assert(r.symbol() == s);
	assert(r.size() == 2);
	assert(r.schemas()[0].is_terminal() && r.schemas()[1].is_terminal());

	assert(r.matches({tree{'a'}, tree{'7'}}));
	assert(!r.matches({tree{'a'}, tree{'b'}}));
	assert(!r.matches({tree{'7'}, tree{'a'}}));
	assert(!r.matches({tree{'a'}}));
	assert(!r.matches({tree{'a'}, tree{'7'}, tree{'7'}}));
	assert(!r.matches(std::vector<tree>{}));
}

void test_nonterminal_matching()
{
	sred::grammar_builder<char> g;
	auto const s = g.issue_symbol();
	auto const t = g.issue_symbol();
	auto const r = g.rule(s).with_nonterminal(t).with_literal('+').build();
	assert(r.schemas()[0].is_nonterminal());

	tree const node_t{t, {tree{'x'}}};
	tree const node_s{s, {tree{'x'}}};
	assert(r.matches({node_t, tree{'+'}}));
	assert(!r.matches({node_s, tree{'+'}}));
	assert(!r.matches({tree{'x'}, tree{'+'}}));
	assert(!r.matches({node_t, node_t}));
}

void test_matching_with_iterators()
{
	sred::grammar_builder<char> g;
	auto const s = g.issue_symbol();
	auto const r = g.rule(s).with_literal('b').with_literal('c').build();
	std::vector<tree> const stack{tree{'a'}, tree{'b'}, tree{'c'}};
	assert(!r.matches(stack.begin(), stack.end()));
	assert(r.matches(std::next(stack.begin()), stack.end()));
	assert(!r.matches(std::next(stack.begin(), 2), stack.end()));
}

void test_null_predicate()
{
	sred::grammar_builder<char> g;
	auto builder = g.rule(g.issue_symbol());
	bool thrown = false;
	try {
		builder.with_terminal(sred::token_predicate<char>{});
	} catch (sred::bad_predicate const&) {
		thrown = true;
	}
	assert(thrown);
	assert(builder.size() == 0);
}

void test_empty_grammar()
{
	sred::grammar_builder<char> g;
	(void)g.issue_symbol();
	assert(g.size() == 0);
	auto const built = std::move(g).build();
	assert(!built);
}

void test_rule_order()
{
	sred::grammar_builder<char> g;
	auto const s = g.issue_symbol();
	auto const t = g.issue_symbol();
	auto const u = g.issue_symbol();
	g.add_rule(g.rule(s).with_literal('a').build());
	g.add_rule(g.rule(t).with_literal('b').with_literal('b').with_literal('b').build());
	g.add_rule(g.rule(u).with_nonterminal(s).with_nonterminal(t).build());
	assert(g.size() == 3);

	auto const built = std::move(g).build();
	assert(built);
	assert(built->size() == 3);
	assert(built->default_rule().symbol() == s);
	assert(built->rules()[0].symbol() == s);
	assert(built->rules()[1].symbol() == t);
	assert(built->rules()[2].symbol() == u);
	assert(built->max_rule_length() == 3);
	assert(built->scope() == s.scope);
}

void test_tree_access()
{
	sred::identifier_generator ids;
	auto const s = ids.next_id();
	tree const leaf{'q'};
	tree const node{s, {tree{'a'}, tree{s, {tree{'b'}}}, tree{'c'}}};

	assert(leaf.is_leaf() && !leaf.is_node());
	assert(leaf.token() == 'q');
	assert(leaf.size() == 0);
	assert(node.is_node() && !node.is_leaf());
	assert(node.symbol() == s);
	assert(node.size() == 3);
	assert(node[1].is_node());
	assert(node[1][0].token() == 'b');

	assert((sred::leaves(node) == std::vector<char>{'a', 'b', 'c'}));
	assert(sred::count_nodes(node) == 2);
	assert(sred::count_nodes(leaf) == 0);

	bool thrown = false;
	try {
		(void)leaf.symbol();
	} catch (sred::bad_tree_access const&) {
		thrown = true;
	}
	assert(thrown);

	thrown = false;
	try {
		(void)node.token();
	} catch (sred::bad_tree_access const&) {
		thrown = true;
	}
	assert(thrown);

	auto children = tree{node}.children();
	assert(children.size() == 3);
}

int main()
{
	try {
		test_terminal_matching();
		test_nonterminal_matching();
		test_matching_with_iterators();
		test_null_predicate();
		test_empty_grammar();
		test_rule_order();
		test_tree_access();
	} catch (std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return -1;
	} catch (...) {
		std::cerr << "Unknown Error\n";
		return -1;
	}
	return 0;
}
