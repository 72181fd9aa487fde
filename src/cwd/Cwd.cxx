// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Cwd.hxx"
#include "Accessor.hxx"

#include <new> // for std::bad_alloc
#include <system_error>

std::filesystem::path
Cwd::Get()
{
	auto path = CwdDetail::GetCurrentDirectory();
	if (options.full_expected && !expected)
		expected = path;
	return path;
}

void
Cwd::Set(const std::filesystem::path &path)
{
	if (!options.full_expected) {
		CwdDetail::SetCurrentDirectory(path);
		return;
	}

	CwdDetail::SetCurrentDirectory(path);

	if (path.is_absolute()) {
		expected = path;
		return;
	}

	/* record relative paths as the absolute directory they
	   resolved to */
	try {
		expected = CwdDetail::GetCurrentDirectory();
	} catch (const std::system_error &) {
		expected = path;
	}
}

std::optional<std::filesystem::path>
Cwd::GetExpected()
{
	if (expected || !options.full_expected)
		return expected;

	return Get();
}

void
Cwd::PushScope()
{
	stack.Push();

	if (options.full_expected && !expected)
		expected = stack.back();

	logger.Fmt(3, "push {:?} depth={}",
		   stack.back().c_str(), stack.size());
}

std::optional<std::filesystem::path>
Cwd::PopScope()
{
	auto path = stack.Pop();
	if (!path)
		return std::nullopt;

	if (options.full_expected)
		expected = *path;

	logger.Fmt(3, "pop {:?} depth={}", path->c_str(), stack.size());
	return path;
}

void
Cwd::DiscardScope() noexcept
{
	stack.entries.pop_back();
}

void
Cwd::RestoreFailed(const std::filesystem::path &path,
		   std::exception_ptr error) noexcept
{
	poisoned = true;

	try {
		expected = path;
	} catch (const std::bad_alloc &) {
		/* the stack still has the entry */
	}

	logger(1, "Failed to restore ", path, ", lock poisoned: ", error);
}

void
Cwd::ScopeLost() noexcept
{
	poisoned = true;
	logger(1, "Scope ended without a stack entry to restore, lock poisoned");
}
