// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <fmt/format.h>

CwdRestoreError::CwdRestoreError(std::error_code _code,
				 std::filesystem::path _path)
	:std::system_error(_code,
			   fmt::format("Failed to restore working directory {:?}",
				       _path.c_str())),
	 path(std::move(_path)) {}

CwdScopeLostError::CwdScopeLostError()
	:std::logic_error("Working directory scope ended without a stack entry to restore") {}

static std::string
MakePoisonedMessage(const std::optional<std::filesystem::path> &expected)
{
	if (!expected)
		return "Working directory lock is poisoned";

	return fmt::format("Working directory lock is poisoned, expected {:?}",
			   expected->c_str());
}

CwdPoisonedError::CwdPoisonedError(std::optional<std::filesystem::path> _expected)
	:std::runtime_error(MakePoisonedMessage(_expected)),
	 expected(std::move(_expected)) {}
