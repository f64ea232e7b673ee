/*
 * dfakit_reachability - which states can be reached from which
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * The per-state functions take the transition as a callable together with the
 * vocabulary, so that they can be used with both forms of automata and with
 * transitions that have no automaton around them.
 */
#pragma once

#include <cstddef>
#include <vector>

#include <dfakit/dfakit_dfa.hpp>
#include <dfakit/dfakit_fixpoint.hpp>
#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_utils.hpp>

namespace dfakit {


/*
 * destinations_from - one step successors of a state
 *
 * The result contains one destination per symbol in vocabulary order.
 * Duplicates are kept.
 */
template <state_type St, symbol_type Sy, typename F>
requires transition_function<F, St, Sy>
std::vector<St>
destinations_from(const F &transition, const std::vector<Sy> &vocabulary, const St &origin)
{
	std::vector<St> result;
	result.reserve(vocabulary.size());
	for (const Sy &y: vocabulary)
		result.push_back(transition(origin, y));
	return result;
}


/*
 * transitions_from_to - all symbols that move origin to destination
 */
template <state_type St, symbol_type Sy, typename F>
requires transition_function<F, St, Sy>
std::vector<Sy>
transitions_from_to(
		const F &transition,
		const std::vector<Sy> &vocabulary,
		const St &origin,
		const St &destination)
{
	std::vector<Sy> result;
	for (const Sy &y: vocabulary)
		if (transition(origin, y) == destination)
			result.push_back(y);
	return result;
}


/*
 * reached_states_from - all states reachable from origin, including origin
 *
 * The result is sorted and free of duplicates. It is the least superset of
 * {origin} that is closed under one step transitions. The closure grows at
 * most once per reachable state, which max_iterations must account for.
 */
template <ordered_state_type St, symbol_type Sy, typename F>
requires transition_function<F, St, Sy>
std::vector<St>
reached_states_from(
		const F &transition,
		const std::vector<Sy> &vocabulary,
		const St &origin,
		size_t max_iterations = default_closure_max_iterations)
{
	auto seed = destinations_from(transition, vocabulary, origin);
	seed.push_back(origin);

	return fixpoint(
			[&](const std::vector<St> &current) {
				std::vector<St> next = current;
				for (const St &s: current)
					for (const Sy &y: vocabulary)
						next.push_back(transition(s, y));
				return next;
			},
			std::move(seed),
			max_iterations);
}


/*
 * reachable_states - all states of an automaton reachable from its start
 */
template <automaton A>
requires ordered_state_type<typename A::state_t>
std::vector<typename A::state_t>
reachable_states(const A &a)
{
	return reached_states_from(transition_of(a), a.vocabulary, a.start, closure_bound(a));
}


/*
 * reachable_states - with the closure bound taken from the options
 *
 * The bound applies only if the automaton does not enumerate its states.
 */
template <automaton A>
requires ordered_state_type<typename A::state_t>
std::vector<typename A::state_t>
reachable_states(const A &a, const dfa_options &opts)
{
	return reached_states_from(transition_of(a), a.vocabulary, a.start,
			closure_bound(a, opts.closure_max_iterations));
}


/*
 * unreachable_states - declared states that cannot be reached from start
 *
 * The result keeps the order of the automaton's states.
 */
template <automaton A>
requires ordered_state_type<typename A::state_t>
std::vector<typename A::state_t>
unreachable_states(const A &a)
{
	auto result = difference(a.states, reachable_states(a));
	if (!result.empty())
		log_debug("unreachable_states: ", result.size(), " of ", a.states.size(), " states unreachable\n");
	return result;
}


} // dfakit::
