// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>
#include <optional>

class Cwd;

/**
 * Remember the current working directory and change back to it in
 * the destructor and in each Reset() call.  Unlike #ScopedCwd, this
 * does not use the #CwdStack and it may be reset any number of
 * times.
 *
 * A failed restore in the destructor poisons the lock and records
 * the directory as "expected" (see LockedCwd::GetExpected()).
 */
class CwdGuard {
	friend class LockedCwd;

	Cwd &cwd;

	const std::filesystem::path initial;

	const int uncaught_exceptions;

	[[nodiscard]]
	explicit CwdGuard(Cwd &_cwd);

public:
	~CwdGuard() noexcept(false);

	CwdGuard(const CwdGuard &) = delete;
	CwdGuard &operator=(const CwdGuard &) = delete;

	/**
	 * Create a nested guard which remembers the current working
	 * directory.
	 */
	[[nodiscard]]
	CwdGuard Guard();

	const std::filesystem::path &GetInitial() const noexcept {
		return initial;
	}

	std::filesystem::path Get();
	void Set(const std::filesystem::path &path);
	std::optional<std::filesystem::path> GetExpected();

	/**
	 * Change back to the directory which was current when this
	 * object was created.
	 *
	 * Throws std::system_error on error.
	 */
	void Reset();
};
