// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Options.hxx"
#include "Stack.hxx"
#include "io/Logger.hxx"

#include <exception>
#include <filesystem>
#include <optional>

/**
 * The process-wide working directory state.  There is exactly one
 * instance, owned by the #CwdMutex; all access goes through a
 * #LockedCwd (or a guard created from it).
 */
class Cwd {
	friend class CwdMutex;
	friend class LockedCwd;
	friend class ScopedCwd;
	friend class CwdGuard;
	friend class CwdStackAccessor;

	LLogger logger{"cwd"};

	CwdStack stack;

	/**
	 * Where the working directory should be.  Set after a failed
	 * restore (and more often with #CwdOptions::full_expected).
	 */
	std::optional<std::filesystem::path> expected;

	CwdOptions options;

	/**
	 * Set when a restore failed at the end of a scope, when a
	 * scope lost its stack entry, or when a #LockedCwd was
	 * destroyed by an exception with directories left on the
	 * stack.  While set,
	 * CwdMutex::Lock() refuses to hand out the lock.
	 */
	bool poisoned = false;

	Cwd() noexcept = default;

public:
	Cwd(const Cwd &) = delete;
	Cwd &operator=(const Cwd &) = delete;

	/**
	 * Throws std::system_error on error.
	 */
	std::filesystem::path Get();

	/**
	 * Throws std::system_error on error.
	 */
	void Set(const std::filesystem::path &path);

	/**
	 * Returns the recorded expected directory.  With
	 * #CwdOptions::full_expected, this falls back to the current
	 * directory (and may throw std::system_error).
	 */
	std::optional<std::filesystem::path> GetExpected();

	void ClearExpected() noexcept {
		expected.reset();
	}

	const CwdOptions &GetOptions() const noexcept {
		return options;
	}

	void SetOptions(const CwdOptions &_options) noexcept {
		options = _options;
	}

private:
	void PushScope();
	std::optional<std::filesystem::path> PopScope();

	/**
	 * Remove the most recent entry without changing the working
	 * directory.
	 */
	void DiscardScope() noexcept;

	/**
	 * A restore at the end of a scope has failed: record the
	 * directory, poison the lock and log the error.
	 */
	void RestoreFailed(const std::filesystem::path &path,
			   std::exception_ptr error) noexcept;

	/**
	 * A scope ended but its stack entry had already been removed
	 * (through #CwdStackAccessor): poison the lock and log.
	 */
	void ScopeLost() noexcept;
};
