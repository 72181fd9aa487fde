// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CwdGuard.hxx"
#include "Cwd.hxx"
#include "Error.hxx"

#include <exception> // for std::uncaught_exceptions()

CwdGuard::CwdGuard(Cwd &_cwd)
	:cwd(_cwd), initial(cwd.Get()),
	 uncaught_exceptions(std::uncaught_exceptions()) {}

CwdGuard::~CwdGuard() noexcept(false)
{
	try {
		Reset();
	} catch (const std::system_error &e) {
		cwd.RestoreFailed(initial, std::current_exception());

		if (std::uncaught_exceptions() > uncaught_exceptions)
			return;

		throw CwdRestoreError{e.code(), initial};
	}
}

CwdGuard
CwdGuard::Guard()
{
	return CwdGuard{cwd};
}

std::filesystem::path
CwdGuard::Get()
{
	return cwd.Get();
}

void
CwdGuard::Set(const std::filesystem::path &path)
{
	cwd.Set(path);
}

std::optional<std::filesystem::path>
CwdGuard::GetExpected()
{
	return cwd.GetExpected();
}

void
CwdGuard::Reset()
{
	cwd.Set(initial);
}
