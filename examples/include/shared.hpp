#pragma once

#include <cstdlib>
#include <iostream>

// some debugging flags
#define DEBUG			true
#define	DEBUG_VERBOSE	false

#if DEBUG_VERBOSE
	#define DFAKIT_ENABLE_LOG_LEVEL_VERBOSE
#elif DEBUG
	#define DFAKIT_ENABLE_LOG_LEVEL_DEBUG
#else
	#define DFAKIT_ENABLE_LOG_LEVEL_WARNING
#endif


// number of failed checks in the current test program
inline int test_failures = 0;

// report a failed check on std::cerr, and continue with the test
#define CHECK(COND)                                                          \
	do {                                                                     \
		if (!(COND)) {                                                       \
			std::cerr << __FILE__ << ":" << __LINE__ << ": check failed: "   \
				<< #COND << "\n";                                            \
			++test_failures;                                                 \
		}                                                                    \
	} while (0)

// check that an expression throws an exception of a given type
#define CHECK_THROWS(EXPR, EXCEPTION_T)                                      \
	do {                                                                     \
		bool _thrown = false;                                                \
		try { (void)(EXPR); }                                                \
		catch (const EXCEPTION_T &) { _thrown = true; }                      \
		if (!_thrown) {                                                      \
			std::cerr << __FILE__ << ":" << __LINE__ << ": expected "        \
				<< #EXCEPTION_T << " from " << #EXPR << "\n";                \
			++test_failures;                                                 \
		}                                                                    \
	} while (0)

#define TEST_RESULT() \
	(test_failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE)
