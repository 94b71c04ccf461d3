// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SRED_INCLUDE_SRED_GRAMMAR_HPP
#define SRED_INCLUDE_SRED_GRAMMAR_HPP

#include <sred/detail.hpp>
#include <sred/error.hpp>
#include <sred/identifier.hpp>
#include <sred/lexer.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sred {

template <class> class basic_reducer;
template <class> class grammar;
template <class> class grammar_builder;
template <class> class parse_tree;
template <class> class rule;
template <class> class rule_builder;
template <class> class symbol_schema;

template <class Token> using token_predicate = std::function<bool(Token const&)>;

enum class reduction_policy : std::uint_least8_t { permissive, strict };

// Leaf holding one token, or node holding a symbol and its ordered children.
template <class Token>
class parse_tree
{
public:
	using token_type = Token;
	using children_type = std::vector<parse_tree>;

private:
	struct branch
	{
		identifier symbol;
		children_type children;
	};

	std::variant<Token, branch> value_;

	[[nodiscard]] branch const& node() const { if (auto const* b = std::get_if<1>(&value_); b != nullptr) return *b; throw bad_tree_access{}; }
	[[nodiscard]] branch& node() { if (auto* b = std::get_if<1>(&value_); b != nullptr) return *b; throw bad_tree_access{}; }

public:
	explicit parse_tree(Token t) : value_{std::in_place_index<0>, std::move(t)} {}
	parse_tree(identifier symbol, children_type children) : value_{std::in_place_index<1>, branch{symbol, std::move(children)}} {}
	[[nodiscard]] bool is_leaf() const noexcept { return value_.index() == 0; }
	[[nodiscard]] bool is_node() const noexcept { return value_.index() == 1; }
	[[nodiscard]] Token const& token() const& { if (auto const* t = std::get_if<0>(&value_); t != nullptr) return *t; throw bad_tree_access{}; }
	[[nodiscard]] Token&& token() && { if (auto* t = std::get_if<0>(&value_); t != nullptr) return std::move(*t); throw bad_tree_access{}; }
	[[nodiscard]] identifier symbol() const { return node().symbol; }
	[[nodiscard]] children_type const& children() const& { return node().children; }
	[[nodiscard]] children_type&& children() && { return std::move(node().children); }
	[[nodiscard]] std::size_t size() const noexcept { auto const* b = std::get_if<1>(&value_); return (b != nullptr) ? b->children.size() : 0; }
	[[nodiscard]] parse_tree const& operator[](std::size_t i) const { return node().children.at(i); }
};

// Right-hand side element: a token predicate (terminal) or a symbol (nonterminal).
template <class Token>
class symbol_schema
{
	std::variant<token_predicate<Token>, identifier> value_;

public:
	explicit symbol_schema(token_predicate<Token> predicate) : value_{std::in_place_index<0>, std::move(predicate)} {}
	explicit symbol_schema(identifier symbol) noexcept : value_{std::in_place_index<1>, symbol} {}
	[[nodiscard]] bool is_terminal() const noexcept { return value_.index() == 0; }
	[[nodiscard]] bool is_nonterminal() const noexcept { return value_.index() == 1; }

	[[nodiscard]] bool matches(parse_tree<Token> const& tree) const
	{
		if (auto const* predicate = std::get_if<0>(&value_); predicate != nullptr)
			return tree.is_leaf() && (*predicate)(tree.token());
		return tree.is_node() && (tree.symbol() == std::get<1>(value_));
	}
};

template <class Token>
class rule
{
	friend class rule_builder<Token>;

	identifier symbol_;
	std::vector<symbol_schema<Token>> schemas_;

	rule(identifier symbol, std::vector<symbol_schema<Token>> schemas) : symbol_{symbol}, schemas_{std::move(schemas)} {}

public:
	using token_type = Token;
	[[nodiscard]] identifier symbol() const noexcept { return symbol_; }
	[[nodiscard]] std::vector<symbol_schema<Token>> const& schemas() const noexcept { return schemas_; }
	[[nodiscard]] std::size_t size() const noexcept { return schemas_.size(); }

	// Candidates match when they pair up one-to-one with the schemas, in order.
	template <class ForwardIt>
	[[nodiscard]] bool matches(ForwardIt first, ForwardIt last) const
	{
		if (static_cast<std::size_t>(std::distance(first, last)) != schemas_.size())
			return false;
		return std::equal(schemas_.begin(), schemas_.end(), first,
			[](symbol_schema<Token> const& s, parse_tree<Token> const& t) { return s.matches(t); });
	}

	[[nodiscard]] bool matches(std::vector<parse_tree<Token>> const& candidates) const
	{
		return matches(candidates.begin(), candidates.end());
	}
};

template <class Token>
class rule_builder
{
	identifier symbol_;
	std::vector<symbol_schema<Token>> schemas_;

public:
	explicit rule_builder(identifier symbol) noexcept : symbol_{symbol} {}

	rule_builder& with_terminal(token_predicate<Token> predicate)
	{
		if (!predicate)
			throw bad_predicate{};
		schemas_.emplace_back(std::move(predicate));
		return *this;
	}

	template <class T = Token, class = std::enable_if_t<detail::is_equality_comparable_v<T>>>
	rule_builder& with_literal(Token value)
	{
		return with_terminal([v = std::move(value)](Token const& t) { return t == v; });
	}

	rule_builder& with_nonterminal(identifier symbol)
	{
		schemas_.emplace_back(symbol);
		return *this;
	}

	[[nodiscard]] std::size_t size() const noexcept { return schemas_.size(); }
	[[nodiscard]] rule<Token> build() const { return rule<Token>{symbol_, schemas_}; }
};

template <class Token>
class grammar
{
	friend class grammar_builder<Token>;

	identifier_generator generator_;
	std::vector<rule<Token>> rules_;
	std::size_t max_rule_length_{0};

	grammar(identifier_generator&& generator, std::vector<rule<Token>>&& rules)
		: generator_{std::move(generator)}, rules_{std::move(rules)}
	{
		for (auto const& r : rules_)
			max_rule_length_ = (std::max)(max_rule_length_, r.size());
	}

public:
	using token_type = Token;
	[[nodiscard]] rule<Token> const& default_rule() const noexcept { return rules_.front(); }
	[[nodiscard]] std::vector<rule<Token>> const& rules() const noexcept { return rules_; }
	[[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }
	[[nodiscard]] std::size_t max_rule_length() const noexcept { return max_rule_length_; }
	[[nodiscard]] std::size_t scope() const noexcept { return generator_.scope(); }

	template <class InputRng, class = detail::enable_if_input_range_of_t<InputRng, Token>>
	[[nodiscard]] std::optional<parse_tree<Token>> parse(InputRng&& tokens) const
	{
		basic_reducer<Token> reducer{*this};
		return reducer.parse(std::forward<InputRng>(tokens));
	}
};

template <class Token>
class grammar_builder
{
	identifier_generator generator_;
	std::optional<sred::rule<Token>> default_rule_;
	std::vector<sred::rule<Token>> rules_;

public:
	using token_type = Token;
	[[nodiscard]] identifier issue_symbol() noexcept { return generator_.next_id(); }
	[[nodiscard]] rule_builder<Token> rule(identifier lhs) const noexcept { return rule_builder<Token>{lhs}; }
	[[nodiscard]] std::size_t size() const noexcept { return rules_.size() + (default_rule_ ? 1 : 0); }

	grammar_builder& add_rule(sred::rule<Token> r)
	{
		if (!default_rule_)
			default_rule_.emplace(std::move(r));
		else
			rules_.push_back(std::move(r));
		return *this;
	}

	[[nodiscard]] std::optional<grammar<Token>> build() &&
	{
		if (!default_rule_)
			return std::nullopt;
		std::vector<sred::rule<Token>> all;
		all.reserve(rules_.size() + 1);
		all.push_back(std::move(*default_rule_));
		std::move(rules_.begin(), rules_.end(), std::back_inserter(all));
		default_rule_.reset();
		rules_.clear();
		return grammar<Token>{std::move(generator_), std::move(all)};
	}
};

// Shift-reduce engine. Each pushed token is shifted as a leaf, then the
// longest trailing run of the stack that some rule matches is replaced by a
// node for that rule. At most one reduction happens per token.
template <class Token>
class basic_reducer
{
	grammar<Token> const* grammar_;
	std::vector<parse_tree<Token>> stack_;
	std::vector<parse_tree<Token>> residue_;
	reduction_policy policy_;
	bool complete_{false};
	bool reducing_{false};

	virtual void on_reset() {}
	virtual void on_shift(parse_tree<Token> const& /*leaf*/) {}
	virtual void on_reduce(rule<Token> const& /*r*/, parse_tree<Token> const& /*node*/) {}
	virtual void on_finish(std::optional<parse_tree<Token>> const& /*result*/) {}

	[[nodiscard]] bool reduce()
	{
		std::size_t const depth = stack_.size();
		std::size_t const longest = grammar_->max_rule_length();
		for (std::size_t i = (depth > longest) ? (depth - longest) : 0; i < depth; ++i) {
			auto const first = std::next(stack_.begin(), static_cast<std::ptrdiff_t>(i));
			for (auto const& r : grammar_->rules()) {
				if (r.matches(first, stack_.end())) {
					typename parse_tree<Token>::children_type children{std::make_move_iterator(first), std::make_move_iterator(stack_.end())};
					stack_.erase(first, stack_.end());
					stack_.emplace_back(r.symbol(), std::move(children));
					on_reduce(r, stack_.back());
					return true;
				}
			}
		}
		return false;
	}

public:
	using token_type = Token;

	explicit basic_reducer(grammar<Token> const& g, reduction_policy policy = reduction_policy::permissive) noexcept
		: grammar_{&g}, policy_{policy} {}
	basic_reducer(basic_reducer const&) = delete;
	basic_reducer(basic_reducer&&) = default;
	basic_reducer& operator=(basic_reducer const&) = delete;
	basic_reducer& operator=(basic_reducer&&) = default;
	virtual ~basic_reducer() = default;
	[[nodiscard]] reduction_policy policy() const noexcept { return policy_; }
	void policy(reduction_policy p) noexcept { policy_ = p; }
	[[nodiscard]] std::vector<parse_tree<Token>> const& stack() const noexcept { return stack_; }
	[[nodiscard]] std::size_t depth() const noexcept { return stack_.size(); }
	[[nodiscard]] std::vector<parse_tree<Token>> const& residue() const noexcept { return residue_; }
	[[nodiscard]] bool complete() const noexcept { return complete_; }

	void reset()
	{
		detail::reentrancy_sentinel<reenterant_parse_error> const guard{reducing_};
		stack_.clear();
		residue_.clear();
		complete_ = false;
		on_reset();
	}

	bool push(Token token)
	{
		detail::reentrancy_sentinel<reenterant_parse_error> const guard{reducing_};
		stack_.emplace_back(std::move(token));
		on_shift(stack_.back());
		return reduce();
	}

	// Ends the current input. Nodes beneath the result are moved to the
	// residue; under the strict policy an incomplete stack yields nothing and
	// the residue holds every node.
	std::optional<parse_tree<Token>> finish()
	{
		detail::reentrancy_sentinel<reenterant_parse_error> const guard{reducing_};
		std::optional<parse_tree<Token>> result;
		complete_ = (stack_.size() == 1);
		residue_.clear();
		if ((policy_ == reduction_policy::strict) && !complete_) {
			residue_ = std::move(stack_);
		} else if (!stack_.empty()) {
			result.emplace(detail::pop_back(stack_));
			residue_ = std::move(stack_);
		}
		stack_.clear();
		on_finish(result);
		return result;
	}

	template <class InputRng, class = detail::enable_if_input_range_of_t<InputRng, Token>>
	std::optional<parse_tree<Token>> parse(InputRng&& tokens)
	{
		reset();
		for (auto&& t : tokens) {
			if constexpr (std::is_rvalue_reference_v<InputRng&&>)
				push(std::move(t));
			else
				push(t);
		}
		return finish();
	}
};

// Streams tokens from the lexer straight into the reducer, throwing lex_error
// on the first diagnostic.
template <class Token>
std::optional<parse_tree<Token>> parse(std::string_view text, lexer<Token>& lex, basic_reducer<Token>& reducer)
{
	reducer.reset();
	auto stream = lex.stream(text);
	while (auto item = stream.next()) {
		if (item->has_error())
			throw lex_error{item->error()};
		reducer.push(std::move(*item).token());
	}
	return reducer.finish();
}

template <class Token>
[[nodiscard]] std::optional<parse_tree<Token>> parse(std::string_view text, lexer<Token>& lex, grammar<Token> const& g)
{
	basic_reducer<Token> reducer{g};
	return sred::parse(text, lex, reducer);
}

template <class Token>
[[nodiscard]] std::vector<Token> leaves(parse_tree<Token> const& tree)
{
	std::vector<Token> tokens;
	std::vector<parse_tree<Token> const*> pending{&tree};
	while (!pending.empty()) {
		auto const* t = detail::pop_back(pending);
		if (t->is_leaf()) {
			tokens.push_back(t->token());
		} else {
			auto const& children = t->children();
			for (auto child = children.rbegin(); child != children.rend(); ++child)
				pending.push_back(&*child);
		}
	}
	return tokens;
}

// Number of nodes in the tree, leaves excluded.
template <class Token>
[[nodiscard]] std::size_t count_nodes(parse_tree<Token> const& tree)
{
	if (tree.is_leaf())
		return 0;
	std::size_t n = 1;
	for (auto const& child : tree.children())
		n += count_nodes(child);
	return n;
}

} // namespace sred

#endif
