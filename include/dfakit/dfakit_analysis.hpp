/*
 * dfakit_analysis - structural properties of automata
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * Two kinds of trap states are distinguished. A dead state cannot reach any
 * final state. A sync state is a non-final state that every symbol maps back to
 * itself. Every sync state is dead, but a dead state may still move between
 * several non-final states.
 *
 * The automaton level functions evaluate the transition for every declared
 * state. They are meant for tabulated automata, see dfakit::tabulate.
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include <dfakit/dfakit_dfa.hpp>
#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_reachability.hpp>
#include <dfakit/dfakit_table.hpp>
#include <dfakit/dfakit_utils.hpp>

namespace dfakit {


/*
 * complement - automaton that accepts exactly the rejected inputs
 *
 * Only the final states change. They become all states that were not final.
 */
template <automaton A>
A
complement(const A &a)
{
	A result = a;
	result.finals = difference(a.states, a.finals);
	return result;
}


/*
 * is_dead - test if no final state is reachable from state
 */
template <ordered_state_type St, symbol_type Sy, typename F>
requires transition_function<F, St, Sy>
bool
is_dead(
		const F &transition,
		const std::vector<Sy> &vocabulary,
		const std::vector<St> &finals,
		const St &state,
		size_t max_iterations = default_closure_max_iterations)
{
	return !intersects(reached_states_from(transition, vocabulary, state, max_iterations), finals);
}


/*
 * is_sync - test if state is not final and every symbol loops on it
 */
template <state_type St, symbol_type Sy, typename F>
requires transition_function<F, St, Sy>
bool
is_sync(
		const F &transition,
		const std::vector<Sy> &vocabulary,
		const std::vector<St> &finals,
		const St &state)
{
	if (contains(finals, state))
		return false;
	for (const Sy &y: vocabulary)
		if (!(transition(state, y) == state))
			return false;
	return true;
}


/*
 * dead_states - all dead states, in the order of the automaton's states
 */
template <automaton A>
requires ordered_state_type<typename A::state_t>
std::vector<typename A::state_t>
dead_states(const A &a)
{
	auto delta = transition_of(a);
	const size_t bound = closure_bound(a);

	std::vector<typename A::state_t> result;
	for (const auto &s: a.states)
		if (is_dead(delta, a.vocabulary, a.finals, s, bound))
			result.push_back(s);
	return result;
}


/*
 * sync_states - all sync states, in the order of the automaton's states
 */
template <automaton A>
std::vector<typename A::state_t>
sync_states(const A &a)
{
	auto delta = transition_of(a);

	std::vector<typename A::state_t> result;
	for (const auto &s: a.states)
		if (is_sync(delta, a.vocabulary, a.finals, s))
			result.push_back(s);
	return result;
}


/*
 * size - number of declared states
 */
template <automaton A>
size_t
size(const A &a)
{
	return a.states.size();
}


/*
 * nodes_and_edges - number of states and number of transitions
 *
 * Every declared state has one outgoing edge per symbol.
 */
template <ordered_automaton A>
std::pair<size_t, size_t>
nodes_and_edges(const A &a)
{
	return {a.states.size(), full_triple_relation(a).size()};
}


/*
 * nodes_and_edges_excluding_trap_states - graph size without dead or sync states
 *
 * Trap states are removed from the nodes. Edges are removed if their destination
 * is a trap state.
 */
template <ordered_automaton A>
std::pair<size_t, size_t>
nodes_and_edges_excluding_trap_states(const A &a)
{
	auto traps = dead_states(a);
	for (auto &s: sync_states(a))
		traps.push_back(s);
	canonicalize(traps);

	const size_t nodes = difference(a.states, traps).size();

	size_t edges = 0;
	for (const auto &t: full_triple_relation(a))
		if (!std::binary_search(traps.begin(), traps.end(), t.destination))
			++edges;

	log_debug("nodes_and_edges_excluding_trap_states: ", traps.size(), " trap states\n");
	return {nodes, edges};
}


/*
 * cyclomatic_complexity - McCabe's number E - N + 2 of the trap free graph
 */
template <ordered_automaton A>
long
cyclomatic_complexity(const A &a)
{
	auto [nodes, edges] = nodes_and_edges_excluding_trap_states(a);
	return static_cast<long>(edges) - static_cast<long>(nodes) + 2;
}


/*
 * incoming_arrow_count - number of (state, symbol) pairs that lead to destination
 *
 * Self loops and parallel edges count individually.
 */
template <state_type St, symbol_type Sy, typename F>
requires transition_function<F, St, Sy>
size_t
incoming_arrow_count(
		const F &transition,
		const std::vector<Sy> &vocabulary,
		const std::vector<St> &states,
		const St &destination)
{
	size_t result = 0;
	for (const St &s: states)
		for (const Sy &y: vocabulary)
			if (transition(s, y) == destination)
				++result;
	return result;
}


/*
 * outgoing_arrow_count - number of edges leaving origin
 *
 * As the transition is total, this is the size of the vocabulary.
 */
template <state_type St, symbol_type Sy, typename F>
requires transition_function<F, St, Sy>
size_t
outgoing_arrow_count(
		const F &transition,
		const std::vector<Sy> &vocabulary,
		const St &origin)
{
	return destinations_from(transition, vocabulary, origin).size();
}


} // dfakit::
