// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SRED_INCLUDE_SRED_LEXER_HPP
#define SRED_INCLUDE_SRED_LEXER_HPP

#include <sred/detail.hpp>
#include <sred/error.hpp>
#include <sred/utf8.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace sred {

template <class> class lexer;
template <class> class lexer_builder;
template <class> class lexer_outcome;
template <class> class recognizer;
template <class> class token_result;
template <class> class token_stream;

struct source_position
{
	std::size_t line{0};
	std::size_t column{0};
	[[nodiscard]] constexpr bool operator==(source_position const& other) const noexcept { return line == other.line && column == other.column; }
	[[nodiscard]] constexpr bool operator!=(source_position const& other) const noexcept { return !(*this == other); }
	[[nodiscard]] constexpr bool operator<(source_position const& other) const noexcept { return line < other.line || (line == other.line && column < other.column); }
	[[nodiscard]] constexpr bool operator<=(source_position const& other) const noexcept { return !(other < *this); }
	[[nodiscard]] constexpr bool operator>(source_position const& other) const noexcept { return other < *this; }
	[[nodiscard]] constexpr bool operator>=(source_position const& other) const noexcept { return !(*this < other); }
};

struct source_range
{
	std::size_t index{0};
	std::size_t size{0};
	[[nodiscard]] constexpr bool operator==(source_range const& other) const noexcept { return index == other.index && size == other.size; }
	[[nodiscard]] constexpr bool operator!=(source_range const& other) const noexcept { return !(*this == other); }
};

struct diagnostic
{
	std::string message;
	std::size_t index{0};
	source_position position;
};

class lex_error : public sred_error
{
	sred::diagnostic diagnostic_;

	[[nodiscard]] static std::string format(sred::diagnostic const& d)
	{
		return std::to_string(d.position.line) + ":" + std::to_string(d.position.column) + ": " + d.message;
	}

public:
	explicit lex_error(sred::diagnostic d) : sred_error{format(d)}, diagnostic_{std::move(d)} {}
	[[nodiscard]] sred::diagnostic const& diagnostic() const noexcept { return diagnostic_; }
};

// Result of offering the head of the remaining input to one recognizer.
template <class Token>
class lexer_outcome
{
	struct success_type { Token token; std::string_view remainder; };
	struct failure_type { std::string message; };
	std::variant<std::monostate, success_type, failure_type> value_;

	explicit lexer_outcome(success_type s) : value_{std::in_place_type<success_type>, std::move(s)} {}
	explicit lexer_outcome(failure_type f) : value_{std::in_place_type<failure_type>, std::move(f)} {}

public:
	using token_type = Token;

	lexer_outcome() noexcept = default;
	[[nodiscard]] static lexer_outcome success(Token token, std::string_view remainder) { return lexer_outcome{success_type{std::move(token), remainder}}; }
	[[nodiscard]] static lexer_outcome ignored() noexcept { return lexer_outcome{}; }
	[[nodiscard]] static lexer_outcome failed(std::string message) { return lexer_outcome{failure_type{std::move(message)}}; }
	[[nodiscard]] bool is_success() const noexcept { return std::holds_alternative<success_type>(value_); }
	[[nodiscard]] bool is_ignored() const noexcept { return std::holds_alternative<std::monostate>(value_); }
	[[nodiscard]] bool is_failed() const noexcept { return std::holds_alternative<failure_type>(value_); }
	[[nodiscard]] Token const& token() const& { return success().token; }
	[[nodiscard]] Token&& token() && { return std::move(success().token); }
	[[nodiscard]] std::string_view remainder() const { return success().remainder; }
	[[nodiscard]] std::string const& message() const& { return failure().message; }
	[[nodiscard]] std::string&& message() && { return std::move(failure().message); }

private:
	[[nodiscard]] success_type const& success() const { if (auto const* s = std::get_if<success_type>(&value_); s != nullptr) return *s; throw bad_outcome_access{}; }
	[[nodiscard]] success_type& success() { if (auto* s = std::get_if<success_type>(&value_); s != nullptr) return *s; throw bad_outcome_access{}; }
	[[nodiscard]] failure_type const& failure() const { if (auto const* f = std::get_if<failure_type>(&value_); f != nullptr) return *f; throw bad_outcome_access{}; }
	[[nodiscard]] failure_type& failure() { if (auto* f = std::get_if<failure_type>(&value_); f != nullptr) return *f; throw bad_outcome_access{}; }
};

template <class Token>
class recognizer
{
public:
	recognizer() = default;
	recognizer(recognizer const&) = default;
	recognizer(recognizer&&) noexcept = default;
	recognizer& operator=(recognizer const&) = default;
	recognizer& operator=(recognizer&&) noexcept = default;
	virtual ~recognizer() = default;

	// Called with non-empty input only. Must return one of the three outcomes;
	// on success the remainder is a proper suffix of input.
	[[nodiscard]] virtual lexer_outcome<Token> recognize(std::string_view input) = 0;
};

template <class Token, class Fn>
class function_recognizer final : public recognizer<Token>
{
	Fn fn_;
public:
	template <class F, class = std::enable_if_t<std::is_constructible_v<Fn, F&&>>>
	explicit function_recognizer(F&& fn) : fn_{std::forward<F>(fn)} {}
	[[nodiscard]] lexer_outcome<Token> recognize(std::string_view input) override { return fn_(input); }
};

// One item of a token stream: either a token or the diagnostic that ended the stream.
template <class Token>
class token_result
{
	std::variant<Token, diagnostic> value_;

public:
	using token_type = Token;
	explicit token_result(Token t) : value_{std::in_place_index<0>, std::move(t)} {}
	explicit token_result(diagnostic d) : value_{std::in_place_index<1>, std::move(d)} {}
	[[nodiscard]] bool has_token() const noexcept { return value_.index() == 0; }
	[[nodiscard]] bool has_error() const noexcept { return value_.index() == 1; }
	[[nodiscard]] explicit operator bool() const noexcept { return has_token(); }
	[[nodiscard]] Token const& token() const& { if (auto const* t = std::get_if<0>(&value_); t != nullptr) return *t; throw bad_result_access{}; }
	[[nodiscard]] Token&& token() && { if (auto* t = std::get_if<0>(&value_); t != nullptr) return std::move(*t); throw bad_result_access{}; }
	[[nodiscard]] diagnostic const& error() const { if (auto const* d = std::get_if<1>(&value_); d != nullptr) return *d; throw bad_result_access{}; }
};

template <class Token>
class lexer
{
	friend class lexer_builder<Token>;
	friend class token_stream<Token>;

	std::vector<std::unique_ptr<recognizer<Token>>> recognizers_;
	std::uint_least32_t tab_width_{default_tab_width};
	std::uint_least32_t tab_alignment_{default_tab_alignment};
	bool streaming_{false};

public:
	using token_type = Token;
	static constexpr std::uint_least32_t default_tab_width{8};
	static constexpr std::uint_least32_t default_tab_alignment{8};

	lexer() = default;
	lexer(lexer const&) = delete;
	lexer(lexer&&) noexcept = default;
	lexer& operator=(lexer const&) = delete;
	lexer& operator=(lexer&&) noexcept = default;
	~lexer() = default;
	[[nodiscard]] std::size_t size() const noexcept { return recognizers_.size(); }
	[[nodiscard]] bool empty() const noexcept { return recognizers_.empty(); }
	[[nodiscard]] std::uint_least32_t tab_width() const noexcept { return tab_width_; }
	void tab_width(std::uint_least32_t w) noexcept { tab_width_ = w; }
	[[nodiscard]] std::uint_least32_t tab_alignment() const noexcept { return tab_alignment_; }
	void tab_alignment(std::uint_least32_t a) noexcept { tab_alignment_ = (a != 0) ? a : 1; }

	// The text must outlive the returned stream.
	[[nodiscard]] token_stream<Token> stream(std::string_view text) { return token_stream<Token>{*this, text}; }

	// Offers input to each recognizer in order; the first one that does not
	// ignore it decides.
	[[nodiscard]] lexer_outcome<Token> recognize(std::string_view input)
	{
		for (auto& r : recognizers_) {
			auto outcome = r->recognize(input);
			if (!outcome.is_ignored())
				return outcome;
		}
		return lexer_outcome<Token>::ignored();
	}
};

template <class Token>
class lexer_builder
{
	std::vector<std::unique_ptr<recognizer<Token>>> recognizers_;
	std::uint_least32_t tab_width_{lexer<Token>::default_tab_width};
	std::uint_least32_t tab_alignment_{lexer<Token>::default_tab_alignment};

public:
	using token_type = Token;

	lexer_builder& add(std::unique_ptr<recognizer<Token>> r)
	{
		if (!r)
			throw bad_recognizer{};
		recognizers_.push_back(std::move(r));
		return *this;
	}

	template <class Fn, class = std::enable_if_t<std::is_invocable_r_v<lexer_outcome<Token>, std::decay_t<Fn>&, std::string_view>>>
	lexer_builder& add(Fn&& fn)
	{
		return add(std::make_unique<function_recognizer<Token, std::decay_t<Fn>>>(std::forward<Fn>(fn)));
	}

	template <class R, class... Args>
	lexer_builder& emplace(Args&&... args)
	{
		static_assert(std::is_base_of_v<recognizer<Token>, R>, "R must derive from sred::recognizer<Token>");
		return add(std::make_unique<R>(std::forward<Args>(args)...));
	}

	lexer_builder& add_all(std::vector<std::unique_ptr<recognizer<Token>>> rs)
	{
		for (auto& r : rs)
			add(std::move(r));
		return *this;
	}

	lexer_builder& tab_width(std::uint_least32_t w) noexcept { tab_width_ = w; return *this; }
	lexer_builder& tab_alignment(std::uint_least32_t a) noexcept { tab_alignment_ = a; return *this; }
	[[nodiscard]] std::size_t size() const noexcept { return recognizers_.size(); }

	[[nodiscard]] lexer<Token> build()
	{
		lexer<Token> lex;
		lex.recognizers_ = std::move(recognizers_);
		lex.tab_width(tab_width_);
		lex.tab_alignment(tab_alignment_);
		recognizers_.clear();
		return lex;
	}
};

// Lazy, single-pass sequence of tokens pulled from a lexer. Ends when the
// input is exhausted or right after the first diagnostic.
template <class Token>
class token_stream
{
	friend class lexer<Token>;

	enum class state : std::uint_least8_t { streaming, done, failed };

	lexer<Token>* lexer_;
	std::string_view input_;
	std::size_t index_{0};
	source_range last_{};
	state state_{state::streaming};
	std::size_t line_cache_index_{0};
	std::size_t line_cache_begin_{0};
	std::size_t line_cache_line_{1};
	char line_cache_prev_{'\0'};

	token_stream(lexer<Token>& lex, std::string_view text) noexcept : lexer_{&lex}, input_{text} {}

	[[nodiscard]] std::size_t consumed_by(std::string_view rest, std::string_view remainder) const
	{
		if (remainder.empty())
			return rest.size();
		if ((remainder.size() > rest.size()) || (remainder.data() + remainder.size() != rest.data() + rest.size()))
			throw bad_remainder{};
		if (remainder.size() == rest.size())
			throw stalled_recognizer_error{};
		return rest.size() - remainder.size();
	}

public:
	using token_type = Token;
	using value_type = token_result<Token>;

	class iterator
	{
	public:
		using iterator_category = std::input_iterator_tag;
		using value_type = token_result<Token>;
		using difference_type = std::ptrdiff_t;
		using pointer = value_type const*;
		using reference = value_type const&;

	private:
		token_stream* stream_{nullptr};
		std::optional<value_type> current_;

		void advance()
		{
			current_ = stream_->next();
			if (!current_)
				stream_ = nullptr;
		}

	public:
		iterator() noexcept = default;
		explicit iterator(token_stream& s) : stream_{&s} { advance(); }
		[[nodiscard]] reference operator*() const { return *current_; }
		[[nodiscard]] pointer operator->() const { return std::addressof(*current_); }
		iterator& operator++() { advance(); return *this; }
		iterator operator++(int) { iterator i{*this}; advance(); return i; }
		[[nodiscard]] friend bool operator==(iterator const& x, iterator const& y) noexcept { return x.stream_ == y.stream_; }
		[[nodiscard]] friend bool operator!=(iterator const& x, iterator const& y) noexcept { return x.stream_ != y.stream_; }
	};

	[[nodiscard]] iterator begin() { return iterator{*this}; }
	[[nodiscard]] iterator end() noexcept { return iterator{}; }
	[[nodiscard]] std::string_view input() const noexcept { return input_; }
	[[nodiscard]] std::string_view remaining() const noexcept { return input_.substr(index_); }
	[[nodiscard]] std::size_t index() const noexcept { return index_; }
	[[nodiscard]] source_range last_range() const noexcept { return last_; }
	[[nodiscard]] bool done() const noexcept { return state_ != state::streaming; }
	[[nodiscard]] bool failed() const noexcept { return state_ == state::failed; }
	[[nodiscard]] source_position position() { return position_at(index_); }

	[[nodiscard]] std::optional<value_type> next()
	{
		if (state_ != state::streaming)
			return std::nullopt;
		detail::reentrancy_sentinel<reenterant_lex_error> const guard{lexer_->streaming_};
		detail::scope_fail const halt{[this]{ state_ = state::done; }};
		while (index_ < input_.size()) {
			std::string_view const rest = input_.substr(index_);
			auto outcome = lexer_->recognize(rest);
			if (outcome.is_ignored()) {
				++index_;
				continue;
			}
			if (outcome.is_failed()) {
				state_ = state::failed;
				return value_type{diagnostic{std::move(outcome).message(), index_, position_at(index_)}};
			}
			std::size_t const n = consumed_by(rest, outcome.remainder());
			last_ = source_range{index_, n};
			index_ += n;
			return value_type{std::move(outcome).token()};
		}
		state_ = state::done;
		return std::nullopt;
	}

	[[nodiscard]] source_position position_at(std::size_t index)
	{
		index = (std::min)(index, input_.size());
		if (index < line_cache_index_) {
			line_cache_index_ = 0;
			line_cache_begin_ = 0;
			line_cache_line_ = 1;
			line_cache_prev_ = '\0';
		}
		for (std::size_t i = line_cache_index_; i < index; ++i) {
			char const c = input_[i];
			if ((c == '\r') || ((c == '\n') && (line_cache_prev_ != '\r'))) {
				++line_cache_line_;
				line_cache_begin_ = i + 1;
			} else if (c == '\n') {
				line_cache_begin_ = i + 1;
			}
			line_cache_prev_ = c;
		}
		line_cache_index_ = index;
		source_position position{line_cache_line_, 1};
		auto first = std::next(input_.begin(), static_cast<std::ptrdiff_t>(line_cache_begin_));
		auto const last = std::next(input_.begin(), static_cast<std::ptrdiff_t>(index));
		while (first < last) {
			char32_t rune{U'\0'};
			std::tie(first, rune) = utf8::decode_rune(first, last);
			if (rune != U'\t') {
				++position.column;
			} else {
				auto const oldcolumn = position.column;
				auto const newcolumn = oldcolumn + lexer_->tab_width_;
				auto const alignedcolumn = newcolumn - ((newcolumn - 1) % lexer_->tab_alignment_);
				position.column = (std::max)((std::min)(newcolumn, alignedcolumn), oldcolumn);
			}
		}
		return position;
	}
};

// Drains a fresh stream into a vector, throwing lex_error on the first diagnostic.
template <class Token>
[[nodiscard]] std::vector<Token> tokenize(lexer<Token>& lex, std::string_view text)
{
	std::vector<Token> tokens;
	auto stream = lex.stream(text);
	while (auto item = stream.next()) {
		if (item->has_error())
			throw lex_error{item->error()};
		tokens.push_back(std::move(*item).token());
	}
	return tokens;
}

} // namespace sred

#endif
