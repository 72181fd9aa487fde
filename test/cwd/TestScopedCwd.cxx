// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CwdTest.hxx"
#include "cwd/ScopedCwd.hxx"
#include "system/Error.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using ScopedCwdTest = CwdTest;

TEST_F(ScopedCwdTest, Reset)
{
	TempDirectory tmp{"d1/d2"};
	const auto d1 = tmp / "d1", d2 = tmp / "d1/d2";

	auto locked = CwdMutex::Get().Lock();

	auto outer = locked.Scoped();
	outer.Set(d1);
	EXPECT_EQ(outer.Get(), d1);

	auto inner = outer.Scoped();
	inner.Set(d2);
	EXPECT_EQ(inner.Get(), d2);

	EXPECT_EQ(inner.Reset(), d1);
	EXPECT_EQ(locked.Get(), d1);

	EXPECT_EQ(outer.Reset(), initial);
	EXPECT_EQ(locked.Get(), initial);
	EXPECT_TRUE(locked.GetStack().empty());
}

TEST_F(ScopedCwdTest, Destructor)
{
	TempDirectory tmp{"a/b"};

	auto locked = CwdMutex::Get().Lock();
	locked.Set(tmp.GetPath());

	{
		auto outer = locked.Scoped();
		outer.Set(tmp / "a");

		{
			auto inner = outer.Scoped();
			inner.Set(tmp / "a/b");
			EXPECT_EQ(inner.Get(), tmp / "a/b");
		}

		EXPECT_EQ(outer.Get(), tmp / "a");
	}

	EXPECT_EQ(locked.Get(), tmp.GetPath());
	EXPECT_TRUE(locked.GetStack().empty());
}

TEST_F(ScopedCwdTest, RelativeSet)
{
	TempDirectory tmp{"sub/sub"};

	auto locked = CwdMutex::Get().Lock();
	locked.Set(tmp.GetPath());

	{
		auto scope = locked.Scoped();
		scope.Set("sub");
		EXPECT_EQ(scope.Get(), tmp / "sub");

		{
			auto nested = scope.Scoped();
			nested.Set("sub");
			EXPECT_EQ(nested.Get(), tmp / "sub/sub");
		}

		EXPECT_EQ(scope.Get(), tmp / "sub");
	}

	EXPECT_EQ(locked.Get(), tmp.GetPath());
}

TEST_F(ScopedCwdTest, ResetIsIdempotent)
{
	TempDirectory tmp{"x", "y"};

	auto locked = CwdMutex::Get().Lock();
	auto scope = locked.Scoped(tmp / "x");

	EXPECT_EQ(scope.Reset(), initial);
	EXPECT_TRUE(scope.HasReset());

	/* the second reset must not touch the working directory */
	locked.Set(tmp / "y");
	EXPECT_EQ(scope.Reset(), std::nullopt);
	EXPECT_EQ(locked.Get(), tmp / "y");
	EXPECT_TRUE(locked.GetStack().empty());
}

TEST_F(ScopedCwdTest, DestructorAfterReset)
{
	TempDirectory tmp{"x", "y"};

	auto locked = CwdMutex::Get().Lock();

	{
		auto scope = locked.Scoped(tmp / "x");
		EXPECT_EQ(scope.Reset(), initial);
		scope.Set(tmp / "y");
	}

	EXPECT_EQ(locked.Get(), tmp / "y");
}

TEST_F(ScopedCwdTest, ScopedWithPath)
{
	TempDirectory tmp{"a"};

	auto locked = CwdMutex::Get().Lock();

	{
		auto scope = locked.Scoped(tmp / "a");
		EXPECT_EQ(scope.Get(), tmp / "a");
		EXPECT_EQ(locked.GetStack().size(), 1u);
	}

	EXPECT_EQ(locked.Get(), initial);
}

TEST_F(ScopedCwdTest, ScopedWithMissingPath)
{
	TempDirectory tmp;

	auto locked = CwdMutex::Get().Lock();

	try {
		(void)locked.Scoped(tmp / "missing");
		FAIL() << "Changed to a missing directory";
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsFileNotFound(e));
	}

	EXPECT_TRUE(locked.GetStack().empty());
	EXPECT_EQ(locked.Get(), initial);
	EXPECT_FALSE(locked.IsPoisoned());
}

TEST_F(ScopedCwdTest, ResetFailureCanBeRetried)
{
	TempDirectory tmp{"gone", "other"};
	const auto gone = tmp / "gone";

	auto locked = CwdMutex::Get().Lock();
	locked.Set(gone);

	auto scope = locked.Scoped(tmp / "other");
	std::filesystem::remove(gone);

	EXPECT_THROW((void)scope.Reset(), std::system_error);
	EXPECT_FALSE(scope.HasReset());
	ASSERT_EQ(locked.GetStack().size(), 1u);
	EXPECT_EQ(locked.GetStack().GetEntries().front(), gone);

	/* a failed manual reset is an ordinary error, not poison */
	EXPECT_FALSE(locked.IsPoisoned());

	std::filesystem::create_directory(gone);
	EXPECT_EQ(scope.Reset(), gone);
	EXPECT_TRUE(locked.GetStack().empty());
}

TEST_F(ScopedCwdTest, ExceptionInsideScope)
{
	TempDirectory tmp{"a"};

	auto locked = CwdMutex::Get().Lock();

	try {
		auto scope = locked.Scoped(tmp / "a");
		throw std::runtime_error("Oops");
	} catch (const std::runtime_error &e) {
		EXPECT_STREQ(e.what(), "Oops");
	}

	EXPECT_EQ(locked.Get(), initial);
	EXPECT_TRUE(locked.GetStack().empty());

	/* the exception was caught before it reached the lock */
	EXPECT_FALSE(locked.IsPoisoned());
}

TEST_F(ScopedCwdTest, ConcreteScenario)
{
	TempDirectory work{"a/b"};

	auto locked = CwdMutex::Get().Lock();
	locked.Set(work.GetPath());

	{
		auto outer = locked.Scoped();
		outer.Set(work / "a");

		{
			auto nested = outer.Scoped();
			nested.Set(work / "a/b");
		}

		EXPECT_EQ(locked.Get(), work / "a");
	}

	EXPECT_EQ(locked.Get(), work.GetPath());
}
