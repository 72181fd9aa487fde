// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>
#include <optional>

class Cwd;

/**
 * Remember the current working directory, optionally switch to a
 * different one, and restore the old working directory at the end of
 * the scope (in the destructor) or when Reset() is called, whichever
 * comes first.
 *
 * The saved directory is pushed onto the #CwdStack, so scopes can be
 * nested with Scoped(); only the innermost live scope may be used
 * until it has been reset or destroyed.
 *
 * If the destructor fails to restore the old directory, the lock is
 * poisoned, the directory remains on the stack and #CwdRestoreError
 * is thrown (unless the destructor was invoked by another exception,
 * which is then left to propagate).  The same applies, with
 * #CwdScopeLostError, if the directory was popped from the stack
 * through the #CwdStackAccessor before the scope ended.
 */
class ScopedCwd {
	friend class LockedCwd;

	Cwd &cwd;

	const int uncaught_exceptions;

	bool has_reset = false;

	[[nodiscard]]
	explicit ScopedCwd(Cwd &_cwd);

	[[nodiscard]]
	ScopedCwd(Cwd &_cwd, const std::filesystem::path &new_cwd);

public:
	~ScopedCwd() noexcept(false);

	ScopedCwd(const ScopedCwd &) = delete;
	ScopedCwd &operator=(const ScopedCwd &) = delete;

	/**
	 * Begin a nested scope.
	 */
	[[nodiscard]]
	ScopedCwd Scoped();

	/**
	 * Begin a nested scope and change to the specified directory.
	 */
	[[nodiscard]]
	ScopedCwd Scoped(const std::filesystem::path &new_cwd);

	std::filesystem::path Get();
	void Set(const std::filesystem::path &path);
	std::optional<std::filesystem::path> GetExpected();

	bool HasReset() const noexcept {
		return has_reset;
	}

	/**
	 * Restore the working directory which was current when this
	 * scope was created.  Only the first successful call has an
	 * effect.
	 *
	 * Throws std::system_error on error; the scope remains
	 * active then and the reset may be retried.
	 *
	 * @return the restored directory or std::nullopt if this scope
	 * was already reset
	 */
	std::optional<std::filesystem::path> Reset();
};
