// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

class Cwd;

/**
 * The working directories which must be restored, most recent last.
 * Each live #ScopedCwd owns one entry.  An entry whose restore has
 * failed stays here until somebody manages to pop it ("debt").
 *
 * This object lives inside the #CwdMutex and is only accessible
 * while it is locked.
 */
class CwdStack {
	friend class Cwd;

	std::vector<std::filesystem::path> entries;

	CwdStack() noexcept = default;

public:
	CwdStack(const CwdStack &) = delete;
	CwdStack &operator=(const CwdStack &) = delete;

	/**
	 * Save the current working directory.
	 *
	 * Throws std::system_error if it cannot be determined; the
	 * stack is unmodified then.
	 */
	void Push();

	/**
	 * Change back to the most recently saved directory and remove
	 * it from the stack.
	 *
	 * Throws std::system_error if the directory cannot be entered;
	 * the entry remains on the stack then.
	 *
	 * @return the restored directory or std::nullopt if the stack
	 * was empty
	 */
	std::optional<std::filesystem::path> Pop();

	std::span<const std::filesystem::path> GetEntries() const noexcept {
		return entries;
	}

	bool empty() const noexcept {
		return entries.empty();
	}

	std::size_t size() const noexcept {
		return entries.size();
	}

	const std::filesystem::path &back() const noexcept {
		return entries.back();
	}
};

/**
 * Raw access to the #CwdStack for cleaning up after a failed
 * restore.  It can inspect and pop, but never push.
 *
 * @see LockedCwd::GetStack()
 */
class CwdStackAccessor {
	Cwd &cwd;

public:
	explicit CwdStackAccessor(Cwd &_cwd) noexcept
		:cwd(_cwd) {}

	std::span<const std::filesystem::path> GetEntries() const noexcept;

	bool empty() const noexcept {
		return GetEntries().empty();
	}

	std::size_t size() const noexcept {
		return GetEntries().size();
	}

	/**
	 * Retry restoring the most recent entry.
	 *
	 * @see CwdStack::Pop()
	 */
	std::optional<std::filesystem::path> Pop();
};
