#include <algorithm>
#include <cstdlib>
#include <vector>

// configuration happens in shared.hpp
#include "shared.hpp"

#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_fixpoint.hpp>

namespace dfakit {
	DFAKIT_LOG_DECLARATION(new logger_policy_stdcout());
}

using namespace dfakit;


// adds the successor of every element, saturating at 5
static std::vector<int>
saturating_successors(const std::vector<int> &v)
{
	std::vector<int> result = v;
	for (auto x: v)
		result.push_back(std::min(x + 1, 5));
	return result;
}


int
main()
{
	// closure of {0} under saturating successor
	{
		auto result = fixpoint(saturating_successors, std::vector<int>{0}, 10);
		CHECK((result == std::vector<int>{0, 1, 2, 3, 4, 5}));
	}

	// five growing steps and one confirming step fit exactly into a bound of 5
	{
		auto result = fixpoint(saturating_successors, std::vector<int>{0}, 5);
		CHECK(result.size() == 6);
		CHECK_THROWS(fixpoint(saturating_successors, std::vector<int>{0}, 3), closure_limit_exceeded);
	}

	// seed is canonicalized before the first comparison
	{
		auto identity = [](const std::vector<int> &v) { return v; };
		auto result = fixpoint(identity, std::vector<int>{3, 1, 1, 3}, 1);
		CHECK((result == std::vector<int>{1, 3}));
	}

	// step results are canonicalized, so order and duplicates don't matter
	{
		auto reversed = [](const std::vector<int> &v) {
			std::vector<int> result(v.rbegin(), v.rend());
			result.insert(result.end(), v.begin(), v.end());
			return result;
		};
		auto result = fixpoint(reversed, std::vector<int>{2, 1}, 1);
		CHECK((result == std::vector<int>{1, 2}));
	}

	// unbounded growth is reported, including the bound
	{
		auto unbounded = [](const std::vector<int> &v) {
			std::vector<int> result = v;
			result.push_back(v.back() + 1);
			return result;
		};
		bool thrown = false;
		try {
			fixpoint(unbounded, std::vector<int>{0}, 20);
		}
		catch (const closure_limit_exceeded &e) {
			thrown = true;
			CHECK(e.max_iterations == 20);
		}
		CHECK(thrown);
	}

	// equality-only variant on scalar values
	{
		auto doubling = [](const int &x) { return std::min(2 * x, 64); };
		CHECK(fixpoint_eq(doubling, 1, 10) == 64);
		CHECK(fixpoint_eq(doubling, 64, 0) == 64);
		CHECK_THROWS(fixpoint_eq(doubling, 1, 2), closure_limit_exceeded);
	}

	return TEST_RESULT();
}
