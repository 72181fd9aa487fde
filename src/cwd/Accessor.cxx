// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Accessor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <limits.h> // for PATH_MAX
#include <unistd.h> // for getcwd(), chdir()

std::filesystem::path
CwdDetail::GetCurrentDirectory()
{
	char buffer[PATH_MAX];
	if (getcwd(buffer, sizeof(buffer)) == nullptr)
		/* ENOENT if the directory has been deleted */
		throw MakeErrno("Failed to get current working directory");

	return buffer;
}

void
CwdDetail::SetCurrentDirectory(const std::filesystem::path &path)
{
	if (chdir(path.c_str()) < 0)
		throw FmtErrno("Failed to change to directory {:?}",
			       path.c_str());
}
