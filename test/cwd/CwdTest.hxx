// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "cwd/Mutex.hxx"

#include <gtest/gtest.h>

#include <filesystem>
#include <initializer_list>
#include <string>
#include <system_error>

#include <stdlib.h> // for mkdtemp()

/**
 * A temporary directory (canonical path) with optional nested
 * subdirectories, deleted recursively in the destructor.
 */
class TempDirectory {
	std::filesystem::path path;

public:
	explicit TempDirectory(std::initializer_list<const char *> subdirs={}) {
		std::string t = std::filesystem::temp_directory_path() / "cwdlock-test.XXXXXX";
		if (mkdtemp(t.data()) == nullptr)
			throw std::system_error(errno, std::system_category(),
						"mkdtemp() failed");

		path = std::filesystem::canonical(t);

		for (const char *i : subdirs)
			std::filesystem::create_directories(path / i);
	}

	~TempDirectory() noexcept {
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}

	TempDirectory(const TempDirectory &) = delete;
	TempDirectory &operator=(const TempDirectory &) = delete;

	const std::filesystem::path &GetPath() const noexcept {
		return path;
	}

	std::filesystem::path operator/(const char *sub) const {
		return path / sub;
	}
};

/**
 * Remembers the working directory before each test and afterwards
 * drains the stack, clears the poison and changes back.
 */
class CwdTest : public ::testing::Test {
protected:
	std::filesystem::path initial;

	void SetUp() override {
		auto locked = CwdMutex::Get().Lock();
		locked.SetOptions({.full_expected = false});
		locked.ClearExpected();
		initial = locked.Get();
	}

	void TearDown() override {
		auto locked = CwdMutex::Get().LockIgnoringPoison();

		auto stack = locked.GetStack();
		while (!stack.empty()) {
			try {
				stack.Pop();
			} catch (const std::system_error &e) {
				ADD_FAILURE() << "Leftover stack entry: " << e.what();
				break;
			}
		}

		locked.ClearPoison();
		locked.ClearExpected();
		locked.SetOptions({.full_expected = false});
		locked.Set(initial);
	}
};
