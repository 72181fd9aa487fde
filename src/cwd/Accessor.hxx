// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>

/**
 * Thin wrappers for getcwd() and chdir().  These must only be called
 * while the #CwdMutex is held, which is why they are not part of the
 * public API; use #LockedCwd, #ScopedCwd or #CwdGuard instead.
 */
namespace CwdDetail {

/**
 * Throws std::system_error on error.
 *
 * @return the absolute path of the current working directory
 */
std::filesystem::path
GetCurrentDirectory();

/**
 * Throws std::system_error on error.
 */
void
SetCurrentDirectory(const std::filesystem::path &path);

} // namespace CwdDetail
