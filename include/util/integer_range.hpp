#pragma once

#include <algorithm>
#include <cinttypes>
#include <ranges>
#include <vector>

template<typename Integer>
struct integer_range {

	integer_range() = default;

	[[nodiscard]] inline static integer_range from_begin_end(Integer begin, Integer end);

	[[nodiscard]] inline static integer_range from_index_count(Integer index, Integer count);

	[[nodiscard]] inline const Integer& begin() const;

	[[nodiscard]] inline const Integer& end() const;

	[[nodiscard]] inline Integer size() const;

	[[nodiscard]] inline bool empty() const;

	[[nodiscard]] inline auto indices() const;

	// Splits into at most `segment_count` contiguous, non-empty segments whose
	// sizes differ by at most one. Earlier segments take the remainder.
	[[nodiscard]] inline std::vector<integer_range> balanced_segments(std::size_t segment_count) const;

	[[nodiscard]] inline bool operator==(const integer_range&) const = default;

private:
	integer_range(Integer begin, Integer end);

	Integer m_begin{}, m_end{};
};


template<typename Integer>
integer_range<Integer> integer_range<Integer>::from_begin_end(const Integer begin, const Integer end) {
	return integer_range(begin, end);
}

template<typename Integer>
integer_range<Integer> integer_range<Integer>::from_index_count(const Integer index, const Integer count) {
	return integer_range(index, index + count);
}

template<typename Integer>
const Integer& integer_range<Integer>::begin() const {
	return m_begin;
}

template<typename Integer>
const Integer& integer_range<Integer>::end() const {
	return m_end;
}

template<typename Integer>
Integer integer_range<Integer>::size() const {
	return m_end - m_begin;
}

template<typename Integer>
bool integer_range<Integer>::empty() const {
	return m_begin == m_end;
}

template<typename Integer>
auto integer_range<Integer>::indices() const {
	return std::ranges::iota_view{ m_begin, m_end };
}

template<typename Integer>
std::vector<integer_range<Integer>> integer_range<Integer>::balanced_segments(const std::size_t segment_count) const {

	std::vector<integer_range> segments;
	if (empty() or segment_count == 0) {
		return segments;
	}

	const auto used_segment_count = std::min(static_cast<Integer>(segment_count), size());
	const auto min_segment_size = size() / used_segment_count;
	const auto remaining_values = size() % used_segment_count;

	segments.reserve(static_cast<std::size_t>(used_segment_count));

	auto segment_begin = m_begin;
	for (Integer i{}; i != used_segment_count; ++i) {
		const auto segment_size = min_segment_size + static_cast<Integer>(i < remaining_values);
		segments.push_back(from_index_count(segment_begin, segment_size));
		segment_begin += segment_size;
	}

	return segments;
}

template<typename Integer>
integer_range<Integer>::integer_range(const Integer begin, const Integer end) : m_begin{ begin }, m_end{ end } {
}
