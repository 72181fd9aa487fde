// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <system_error> // IWYU pragma: export

#include <errno.h>

/**
 * Returns the error_category to be used to wrap errno values.  The
 * C++ standard does not define this well, so this code is based on
 * observations what C++ standard library implementations actually
 * use.
 *
 * @see https://stackoverflow.com/questions/28746372/system-error-categories-and-standard-system-error-codes
 */
static inline const std::error_category &
ErrnoCategory() noexcept
{
	/* at least with the GNU C++ library, the system_category
	   preserves the errno value and returns std::errc values
	   from default_error_condition() */
	return std::system_category();
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(code, ErrnoCategory(), msg);
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

[[gnu::pure]]
static inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == ErrnoCategory() &&
		e.code().value() == code;
}

/**
 * Was the directory (or one of its ancestors) not found?  This is
 * what getcwd() and chdir() report after the directory has been
 * deleted.
 */
[[gnu::pure]]
static inline bool
IsFileNotFound(const std::system_error &e) noexcept
{
	return IsErrno(e, ENOENT);
}
