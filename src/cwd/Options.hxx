// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#ifndef CWDLOCK_FULL_EXPECTED
#define CWDLOCK_FULL_EXPECTED 0
#endif

struct CwdOptions {
	/**
	 * Record the "expected" working directory on every successful
	 * Get() and Set(), not only after a failed restore?  This
	 * allows detecting working directory changes which bypassed
	 * the lock.
	 */
	bool full_expected = CWDLOCK_FULL_EXPECTED;
};
