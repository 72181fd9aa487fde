// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Cwd.hxx"

#include <filesystem>
#include <mutex>
#include <optional>

class LockedCwd;
class ScopedCwd;
class CwdGuard;

/**
 * The one process-wide lock which protects the current working
 * directory.  Every read or write of the working directory must
 * happen while it is held.
 */
class CwdMutex {
	std::mutex mutex;

	Cwd cwd;

	CwdMutex() noexcept = default;

public:
	CwdMutex(const CwdMutex &) = delete;
	CwdMutex &operator=(const CwdMutex &) = delete;

	/**
	 * Returns the singleton, creating it on the first call.
	 */
	static CwdMutex &Get() noexcept;

	/**
	 * Wait until the lock is available and acquire it.
	 *
	 * Throws #CwdPoisonedError if a previous holder failed to
	 * restore a working directory and nobody has cleaned up yet;
	 * use LockIgnoringPoison() for that.
	 */
	[[nodiscard]]
	LockedCwd Lock();

	/**
	 * Like Lock(), but hand out the lock even if it is poisoned.
	 * This is meant for recovery code.
	 */
	[[nodiscard]]
	LockedCwd LockIgnoringPoison();
};

/**
 * Exclusive ownership of the #CwdMutex (RAII).  If this object is
 * destroyed while an exception thrown after its construction
 * propagates and the stack still holds directories which were not
 * restored, the lock gets poisoned.  Other exceptions leave the lock
 * usable.
 */
class LockedCwd {
	friend class CwdMutex;

	std::unique_lock<std::mutex> lock;

	Cwd *cwd;

	int uncaught_exceptions;

	LockedCwd(std::unique_lock<std::mutex> &&_lock, Cwd &_cwd) noexcept;

public:
	LockedCwd(LockedCwd &&src) noexcept = default;
	LockedCwd &operator=(LockedCwd &&src) = delete;

	~LockedCwd() noexcept;

	std::filesystem::path Get() {
		return cwd->Get();
	}

	void Set(const std::filesystem::path &path) {
		cwd->Set(path);
	}

	std::optional<std::filesystem::path> GetExpected() {
		return cwd->GetExpected();
	}

	void ClearExpected() noexcept {
		cwd->ClearExpected();
	}

	const CwdOptions &GetOptions() const noexcept {
		return cwd->GetOptions();
	}

	void SetOptions(const CwdOptions &options) noexcept {
		cwd->SetOptions(options);
	}

	/**
	 * Begin a new scope: save the current working directory; it
	 * will be restored when the returned object is reset or
	 * destroyed.
	 *
	 * Throws std::system_error on error.
	 */
	[[nodiscard]]
	ScopedCwd Scoped();

	/**
	 * Begin a new scope and change to the specified directory.
	 */
	[[nodiscard]]
	ScopedCwd Scoped(const std::filesystem::path &new_cwd);

	/**
	 * Remember the current working directory without using the
	 * stack; see #CwdGuard.
	 */
	[[nodiscard]]
	CwdGuard Guard();

	/**
	 * Access the stack directly, for cleaning up after a failed
	 * restore.
	 */
	CwdStackAccessor GetStack() noexcept {
		return CwdStackAccessor{*cwd};
	}

	bool IsPoisoned() const noexcept {
		return cwd->poisoned;
	}

	/**
	 * Allow Lock() to succeed again.  Call this after the stack
	 * has been drained (or after deciding that its remaining
	 * entries can be abandoned).
	 */
	void ClearPoison() noexcept;
};
