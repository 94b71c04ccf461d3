// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include <sred/sred.hpp>

#include <iostream>
#include <set>
#include <thread>
#include <vector>

#undef NDEBUG
#include <cassert>

using namespace std::string_view_literals;

void test_generators_on_many_threads()
{
	constexpr std::size_t thread_count = 16;
	constexpr std::size_t generators_per_thread = 64;
	std::vector<std::vector<std::size_t>> scopes(thread_count);
	std::vector<std::thread> threads;
	threads.reserve(thread_count);
	for (std::size_t t = 0; t < thread_count; ++t) {
		threads.emplace_back([&scopes, t] {
			for (std::size_t i = 0; i < generators_per_thread; ++i) {
				sred::identifier_generator g;
				(void)g.next_id();
				scopes[t].push_back(g.scope());
			}
		});
	}
	for (auto& th : threads)
		th.join();

	std::set<std::size_t> distinct;
	for (auto const& s : scopes)
		distinct.insert(s.begin(), s.end());
	assert(distinct.size() == thread_count * generators_per_thread);
}

// S -> a a | ( S )
void test_reducers_sharing_a_grammar()
{
	sred::grammar_builder<char> g;
	auto const s = g.issue_symbol();
	g.add_rule(g.rule(s).with_literal('a').with_literal('a').build());
	g.add_rule(g.rule(s).with_literal('(').with_nonterminal(s).with_literal(')').build());
	auto const rules = std::move(g).build();
	sred::grammar<char> const& shared = *rules;

	constexpr std::size_t rounds = 256;
	std::vector<std::size_t> nodes(2, 0);
	std::vector<std::size_t> leaves(2, 0);
	auto work = [&shared, &nodes, &leaves](std::size_t slot, std::string_view text) {
		sred::basic_reducer<char> r{shared, sred::reduction_policy::strict};
		for (std::size_t i = 0; i < rounds; ++i) {
			auto const result = r.parse(text);
			if (result && result->is_node() && r.complete()) {
				nodes[slot] += sred::count_nodes(*result);
				leaves[slot] += sred::leaves(*result).size();
			}
		}
	};

	std::thread first{work, 0, "aa"sv};
	std::thread second{work, 1, "((aa))"sv};
	first.join();
	second.join();

	assert(nodes[0] == rounds && leaves[0] == rounds * 2);
	assert(nodes[1] == rounds * 3 && leaves[1] == rounds * 6);
}

int main()
{
	try {
		test_generators_on_many_threads();
		test_reducers_sharing_a_grammar();
	} catch (std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return -1;
	} catch (...) {
		std::cerr << "Unknown Error\n";
		return -1;
	}
	return 0;
}
