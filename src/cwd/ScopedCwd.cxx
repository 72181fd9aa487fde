// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ScopedCwd.hxx"
#include "Cwd.hxx"
#include "Error.hxx"

#include <exception> // for std::uncaught_exceptions()

ScopedCwd::ScopedCwd(Cwd &_cwd)
	:cwd(_cwd), uncaught_exceptions(std::uncaught_exceptions())
{
	cwd.PushScope();
}

ScopedCwd::ScopedCwd(Cwd &_cwd, const std::filesystem::path &new_cwd)
	:ScopedCwd(_cwd)
{
	try {
		cwd.Set(new_cwd);
	} catch (...) {
		/* the directory has not changed, so there is nothing
		   to restore; the destructor still runs because the
		   delegated constructor has completed */
		has_reset = true;
		cwd.DiscardScope();
		throw;
	}
}

ScopedCwd::~ScopedCwd() noexcept(false)
{
	if (has_reset)
		return;

	try {
		if (!Reset()) {
			/* our entry was popped through the
			   CwdStackAccessor, there is nothing left to
			   restore */
			cwd.ScopeLost();

			if (std::uncaught_exceptions() > uncaught_exceptions)
				return;

			throw CwdScopeLostError{};
		}
	} catch (const std::system_error &e) {
		const auto path = cwd.stack.back();
		cwd.RestoreFailed(path, std::current_exception());

		if (std::uncaught_exceptions() > uncaught_exceptions)
			/* throwing now would call std::terminate() */
			return;

		throw CwdRestoreError{e.code(), path};
	}
}

ScopedCwd
ScopedCwd::Scoped()
{
	return ScopedCwd{cwd};
}

ScopedCwd
ScopedCwd::Scoped(const std::filesystem::path &new_cwd)
{
	return ScopedCwd{cwd, new_cwd};
}

std::filesystem::path
ScopedCwd::Get()
{
	return cwd.Get();
}

void
ScopedCwd::Set(const std::filesystem::path &path)
{
	cwd.Set(path);
}

std::optional<std::filesystem::path>
ScopedCwd::GetExpected()
{
	return cwd.GetExpected();
}

std::optional<std::filesystem::path>
ScopedCwd::Reset()
{
	if (has_reset)
		return std::nullopt;

	auto path = cwd.PopScope();
	if (!path) {
		/* somebody popped our entry through the
		   CwdStackAccessor */
		cwd.logger(2, "Reset with empty stack");
		return std::nullopt;
	}

	has_reset = true;
	return path;
}
