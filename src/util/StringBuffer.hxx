// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <array>
#include <cstddef>

/**
 * A statically allocated string buffer.
 */
template<std::size_t CAPACITY>
class StringBuffer {
	typedef std::array<char, CAPACITY> Array;
	Array the_data;

public:
	typedef std::size_t size_type;
	typedef char value_type;
	typedef char *pointer;
	typedef const char *const_pointer;
	typedef pointer iterator;

	static_assert(CAPACITY > 0);

	static constexpr size_type capacity() noexcept {
		return CAPACITY;
	}

	constexpr const_pointer c_str() const noexcept {
		return the_data.data();
	}

	constexpr pointer data() noexcept {
		return the_data.data();
	}

	constexpr iterator begin() noexcept {
		return data();
	}
};
