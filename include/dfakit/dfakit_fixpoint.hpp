/*
 * dfakit_fixpoint - Iterate a step function until its result is stable
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * Both reachability and the construction of transition tables grow a finite
 * collection until no new element appears. This file provides the single
 * bounded loop used for both. The caller is responsible for the universe of
 * elements being finite. The iteration bound only turns a violation of this
 * precondition into an exception instead of an endless loop.
 */
#pragma once

#include <cstddef>
#include <concepts>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_utils.hpp>

namespace dfakit {


/*
 * Upper bound on the number of iterations of a closure when the state set of an
 * automaton is not enumerated, i.e. when no bound can be derived from it.
 */
#ifndef DFAKIT_DEFAULT_CLOSURE_MAX_ITERATIONS
#define DFAKIT_DEFAULT_CLOSURE_MAX_ITERATIONS 65536
#endif

inline constexpr size_t
default_closure_max_iterations = DFAKIT_DEFAULT_CLOSURE_MAX_ITERATIONS;


/*
 * closure_limit_exceeded - a closure did not stabilize within its bound
 */
struct closure_limit_exceeded : std::length_error
{
	size_t max_iterations;

	explicit closure_limit_exceeded(size_t n)
		: std::length_error("Closure did not stabilize within " + std::to_string(n) + " iterations.")
		, max_iterations(n)
	{}
};


/*
 * fixpoint_eq - apply step to seed until two consecutive values compare equal
 *
 * Returns the stable value. A monotone step over a universe of n elements that
 * starts from a non-empty seed grows at most n-1 times, and one additional
 * application confirms stability. Hence, max_iterations + 1 applications of
 * step are allowed before closure_limit_exceeded is thrown.
 */
template <typename T, typename StepFn>
requires std::equality_comparable<T> && std::regular_invocable<StepFn&, const T&>
T
fixpoint_eq(StepFn step, T seed, size_t max_iterations)
{
	for (size_t i = 0; i <= max_iterations; ++i) {
		T next = step(seed);
		if (next == seed) {
			log_verbose("fixpoint stable after ", i + 1, " iterations\n");
			return next;
		}
		seed = std::move(next);
	}

	log_error("fixpoint: no stable value after ", max_iterations + 1, " iterations\n");
	throw closure_limit_exceeded(max_iterations);
}


/*
 * fixpoint - closure on sets represented as sorted, duplicate free vectors
 *
 * The seed and every result of step are canonicalized, so that "nothing was
 * added" is detected by plain equality of consecutive results.
 */
template <typename T, typename StepFn>
requires std::totally_ordered<T>
std::vector<T>
fixpoint(StepFn step, std::vector<T> seed, size_t max_iterations)
{
	canonicalize(seed);
	return fixpoint_eq(
			[&step](const std::vector<T> &current) {
				std::vector<T> result = step(current);
				canonicalize(result);
				return result;
			},
			std::move(seed),
			max_iterations);
}


} // dfakit::
