// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Stack.hxx"
#include "Accessor.hxx"
#include "Cwd.hxx"

void
CwdStack::Push()
{
	entries.push_back(CwdDetail::GetCurrentDirectory());
}

std::optional<std::filesystem::path>
CwdStack::Pop()
{
	if (entries.empty())
		return std::nullopt;

	auto previous = std::move(entries.back());
	entries.pop_back();

	try {
		CwdDetail::SetCurrentDirectory(previous);
	} catch (...) {
		/* put it back; the capacity is still there, so this
		   cannot throw */
		entries.push_back(std::move(previous));
		throw;
	}

	return previous;
}

std::span<const std::filesystem::path>
CwdStackAccessor::GetEntries() const noexcept
{
	return cwd.stack.GetEntries();
}

std::optional<std::filesystem::path>
CwdStackAccessor::Pop()
{
	return cwd.PopScope();
}
