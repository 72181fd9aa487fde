// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Mutex.hxx"
#include "ScopedCwd.hxx"
#include "CwdGuard.hxx"
#include "Error.hxx"

#include <exception> // for std::uncaught_exceptions()

CwdMutex &
CwdMutex::Get() noexcept
{
	/* never freed: guards may be alive during static
	   destruction */
	static CwdMutex *const instance = new CwdMutex();
	return *instance;
}

LockedCwd
CwdMutex::Lock()
{
	std::unique_lock<std::mutex> lock{mutex};
	if (cwd.poisoned)
		throw CwdPoisonedError{cwd.expected};

	return LockedCwd{std::move(lock), cwd};
}

LockedCwd
CwdMutex::LockIgnoringPoison()
{
	return LockedCwd{std::unique_lock<std::mutex>{mutex}, cwd};
}

LockedCwd::LockedCwd(std::unique_lock<std::mutex> &&_lock, Cwd &_cwd) noexcept
	:lock(std::move(_lock)), cwd(&_cwd),
	 uncaught_exceptions(std::uncaught_exceptions()) {}

LockedCwd::~LockedCwd() noexcept
{
	if (!lock.owns_lock())
		/* moved from */
		return;

	/* an exception alone is an ordinary error; only unrestored
	   directories leave the state inconsistent */
	if (std::uncaught_exceptions() > uncaught_exceptions &&
	    !cwd->poisoned && !cwd->stack.empty()) {
		cwd->poisoned = true;
		cwd->logger.Fmt(1, "Lock released by exception with {} unrestored directories, poisoned",
				cwd->stack.size());
	}
}

ScopedCwd
LockedCwd::Scoped()
{
	return ScopedCwd{*cwd};
}

ScopedCwd
LockedCwd::Scoped(const std::filesystem::path &new_cwd)
{
	return ScopedCwd{*cwd, new_cwd};
}

CwdGuard
LockedCwd::Guard()
{
	return CwdGuard{*cwd};
}

void
LockedCwd::ClearPoison() noexcept
{
	if (!cwd->poisoned)
		return;

	if (!cwd->stack.empty())
		cwd->logger.Fmt(1, "Clearing poison with {} unrestored directories",
				cwd->stack.size());

	cwd->poisoned = false;
}
