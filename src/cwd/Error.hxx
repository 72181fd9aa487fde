// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <system_error>

/**
 * Thrown by the destructor of #ScopedCwd or #CwdGuard if the
 * previous working directory could not be restored.  By the time
 * this is thrown, the #CwdMutex has been poisoned and the directory
 * is still on the stack (see LockedCwd::GetStack()).
 */
class CwdRestoreError : public std::system_error {
	std::filesystem::path path;

public:
	CwdRestoreError(std::error_code _code, std::filesystem::path _path);

	/**
	 * The directory which should have been restored.
	 */
	const std::filesystem::path &GetPath() const noexcept {
		return path;
	}
};

/**
 * Thrown by the destructor of #ScopedCwd if its stack entry had
 * already been popped through the #CwdStackAccessor, so the working
 * directory could not be restored.  The #CwdMutex has been poisoned.
 */
class CwdScopeLostError : public std::logic_error {
public:
	CwdScopeLostError();
};

/**
 * Thrown by CwdMutex::Lock() after a restore has failed and before
 * the poison was cleared with LockedCwd::ClearPoison().
 */
class CwdPoisonedError : public std::runtime_error {
	std::optional<std::filesystem::path> expected;

public:
	explicit CwdPoisonedError(std::optional<std::filesystem::path> _expected);

	/**
	 * The directory which should be the current one, if known.
	 */
	const std::optional<std::filesystem::path> &GetExpected() const noexcept {
		return expected;
	}
};
