#pragma once

#include <algorithm>
#include <cinttypes>
#include <ranges>

template<typename Integer>
class balanced_segments_t;

// Half-open range of indices [begin, end).
template<typename Integer>
struct integer_range {

	integer_range() = default;

	[[nodiscard]] inline static integer_range from_begin_end(Integer begin, Integer end);

	[[nodiscard]] inline static integer_range from_index_count(Integer index, Integer count);

	[[nodiscard]] inline Integer begin() const;

	[[nodiscard]] inline Integer end() const;

	[[nodiscard]] inline Integer size() const;

	[[nodiscard]] inline auto indices() const;

	// Splits the range into `segment_count` contiguous segments whose sizes differ by at most one.
	[[nodiscard]] inline balanced_segments_t<Integer> balanced_segments(std::size_t segment_count) const;

	bool operator==(const integer_range&) const = default;

private:
	integer_range(Integer begin, Integer end);

	Integer m_begin{}, m_end{};
};


template<typename Integer>
class balanced_segment_iterator_t {
public:
	using value_type = integer_range<Integer>;
	using size_type = std::uint64_t;

	inline balanced_segment_iterator_t(const value_type& range, size_type num_segments, size_type segment_index);

	inline balanced_segment_iterator_t& operator++();
	[[nodiscard]] inline value_type operator*() const;

	[[nodiscard]] inline bool operator==(const balanced_segment_iterator_t&) const;
	[[nodiscard]] inline bool operator!=(const balanced_segment_iterator_t&) const;

private:
	Integer m_begin, m_min_segment_size, m_remaining_values;
	size_type m_segment_index;
};

template<typename Integer>
class balanced_segments_t {
public:
	using iterator = balanced_segment_iterator_t<Integer>;
	using value_type = typename iterator::value_type;
	using size_type = typename iterator::size_type;

	inline balanced_segments_t(const integer_range<Integer>& range, size_type num_segments);

	[[nodiscard]] inline const iterator& begin() const;
	[[nodiscard]] inline const iterator& end() const;

private:
	iterator m_begin, m_end;
};


//--------------------[ balanced_segment_iterator_t ]--------------------//

template<class Integer>
balanced_segment_iterator_t<Integer>::balanced_segment_iterator_t(
	const integer_range<Integer>& range, const size_type num_segments, const size_type segment_index
) :
	m_begin{ range.begin() },
	m_min_segment_size{ static_cast<Integer>(range.size() / static_cast<Integer>(num_segments)) },
	m_remaining_values{ static_cast<Integer>(range.size() % static_cast<Integer>(num_segments)) },
	m_segment_index{ segment_index } {
}

template<class Integer>
typename balanced_segment_iterator_t<Integer>::value_type balanced_segment_iterator_t<Integer>::operator*() const {
	const auto index = static_cast<Integer>(m_segment_index);

	// The first `m_remaining_values` segments take one extra index each.
	const auto segment_begin = m_begin + index * m_min_segment_size + std::min(index, m_remaining_values);
	const auto segment_size = m_min_segment_size + static_cast<Integer>(index < m_remaining_values);

	return value_type::from_index_count(segment_begin, segment_size);
}

template<class Integer>
balanced_segment_iterator_t<Integer>& balanced_segment_iterator_t<Integer>::operator++() {
	++m_segment_index;
	return *this;
}

template<class Integer>
bool balanced_segment_iterator_t<Integer>::operator==(const balanced_segment_iterator_t& other) const {
	return m_segment_index == other.m_segment_index and m_begin == other.m_begin and
		m_min_segment_size == other.m_min_segment_size and m_remaining_values == other.m_remaining_values;
}

template<class Integer>
bool balanced_segment_iterator_t<Integer>::operator!=(const balanced_segment_iterator_t& other) const {
	return not(*this == other);
}


//--------------------[ balanced_segments_t ]--------------------//

template<class Integer>
balanced_segments_t<Integer>::balanced_segments_t(const integer_range<Integer>& range, const size_type num_segments) :
	m_begin{ range, num_segments, 0 }, m_end{ range, num_segments, num_segments } {
}

template<class Integer>
const typename balanced_segments_t<Integer>::iterator& balanced_segments_t<Integer>::begin() const {
	return m_begin;
}

template<class Integer>
const typename balanced_segments_t<Integer>::iterator& balanced_segments_t<Integer>::end() const {
	return m_end;
}


//--------------------[ integer_range ]--------------------//

template<typename Integer>
integer_range<Integer> integer_range<Integer>::from_begin_end(const Integer begin, const Integer end) {
	return integer_range(begin, end);
}

template<typename Integer>
integer_range<Integer> integer_range<Integer>::from_index_count(const Integer index, const Integer count) {
	return integer_range(index, index + count);
}

template<typename Integer>
Integer integer_range<Integer>::begin() const {
	return m_begin;
}

template<typename Integer>
Integer integer_range<Integer>::end() const {
	return m_end;
}

template<typename Integer>
Integer integer_range<Integer>::size() const {
	return m_end - m_begin;
}

template<typename Integer>
auto integer_range<Integer>::indices() const {
	return std::ranges::iota_view{ m_begin, m_end };
}

template<typename Integer>
balanced_segments_t<Integer> integer_range<Integer>::balanced_segments(const std::size_t segment_count) const {
	return balanced_segments_t<Integer>(*this, segment_count);
}

template<typename Integer>
integer_range<Integer>::integer_range(const Integer begin, const Integer end) : m_begin{ begin }, m_end{ end } {
}
