// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SRED_INCLUDE_SRED_IDENTIFIER_HPP
#define SRED_INCLUDE_SRED_IDENTIFIER_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <utility>

namespace sred {

// Symbol identifier, unique within the generator that issued it and never
// equal to an identifier issued by any other generator.
struct identifier
{
	std::size_t scope{0};
	std::size_t sequence{0};
	[[nodiscard]] constexpr bool operator==(identifier const& other) const noexcept { return scope == other.scope && sequence == other.sequence; }
	[[nodiscard]] constexpr bool operator!=(identifier const& other) const noexcept { return !(*this == other); }
	[[nodiscard]] constexpr bool operator<(identifier const& other) const noexcept { return scope < other.scope || (scope == other.scope && sequence < other.sequence); }
	[[nodiscard]] constexpr bool operator<=(identifier const& other) const noexcept { return !(other < *this); }
	[[nodiscard]] constexpr bool operator>(identifier const& other) const noexcept { return other < *this; }
	[[nodiscard]] constexpr bool operator>=(identifier const& other) const noexcept { return !(*this < other); }
};

class identifier_generator
{
	std::size_t scope_;
	std::size_t next_{0};

	[[nodiscard]] static std::size_t acquire_scope() noexcept
	{
		static std::atomic<std::size_t> counter{0};
		return counter.fetch_add(1, std::memory_order_relaxed);
	}

public:
	identifier_generator() noexcept : scope_{acquire_scope()} {}
	identifier_generator(identifier_generator const&) = delete;
	identifier_generator& operator=(identifier_generator const&) = delete;

	// The source continues in a fresh scope so it never repeats an identifier
	// issued by the destination.
	identifier_generator(identifier_generator&& other) noexcept
		: scope_{std::exchange(other.scope_, acquire_scope())}, next_{std::exchange(other.next_, 0)} {}

	identifier_generator& operator=(identifier_generator&& other) noexcept
	{
		if (this != &other) {
			scope_ = std::exchange(other.scope_, acquire_scope());
			next_ = std::exchange(other.next_, 0);
		}
		return *this;
	}

	~identifier_generator() = default;
	[[nodiscard]] std::size_t scope() const noexcept { return scope_; }
	[[nodiscard]] std::size_t issued() const noexcept { return next_; }
	[[nodiscard]] identifier next_id() noexcept { return identifier{scope_, next_++}; }
};

} // namespace sred

namespace std {

template <>
struct hash<sred::identifier>
{
	[[nodiscard]] std::size_t operator()(sred::identifier const& id) const noexcept
	{
		constexpr std::size_t golden_ratio = (sizeof(std::size_t) >= 8) ? static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) : static_cast<std::size_t>(0x9e3779b9UL);
		std::size_t const h = std::hash<std::size_t>{}(id.scope);
		return h ^ (std::hash<std::size_t>{}(id.sequence) + golden_ratio + (h << 6U) + (h >> 2U)); // NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
	}
};

} // namespace std

#endif
