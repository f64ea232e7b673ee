/*
 * dfakit_table - conversion between function form and tabulated automata
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <vector>

#include <dfakit/dfakit_dfa.hpp>
#include <dfakit/dfakit_fixpoint.hpp>
#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_reachability.hpp>
#include <dfakit/dfakit_utils.hpp>

namespace dfakit {


template <automaton A>
using transition_table_of = transition_table<typename A::state_t, typename A::symbol_t>;

template <automaton A>
using transition_triple_of = transition_triple<typename A::state_t, typename A::symbol_t>;


/*
 * to_table - tabulate the states reachable from the start state
 *
 * The table's vocabulary is the sorted vocabulary of the automaton. It starts
 * with the row of the start state, and grows by rows for all destinations that
 * have no row yet, in the order in which they appear in the existing rows. This
 * is repeated until no new state appears. States that are not reachable from
 * start do not get a row.
 */
template <ordered_automaton A>
transition_table_of<A>
to_table(const A &a, size_t max_iterations)
{
	using table_t = transition_table_of<A>;

	auto delta = transition_of(a);
	auto vocabulary = a.vocabulary;
	std::sort(vocabulary.begin(), vocabulary.end());

	table_t seed(vocabulary);
	seed.add_row(a.start, destinations_from(delta, vocabulary, a.start));

	auto result = fixpoint_eq(
			[&](const table_t &current) {
				table_t next = current;
				for (const auto &[state, destinations]: current.rows())
					for (const auto &d: destinations)
						if (!next.has_row(d))
							next.add_row(d, destinations_from(delta, vocabulary, d));
				return next;
			},
			std::move(seed),
			max_iterations);

	log_debug("to_table: ", result.size(), " rows over ", vocabulary.size(), " symbols\n");
	return result;
}


template <ordered_automaton A>
transition_table_of<A>
to_table(const A &a)
{
	return to_table(a, closure_bound(a));
}


template <ordered_automaton A>
transition_table_of<A>
to_table(const A &a, const dfa_options &opts)
{
	return to_table(a, closure_bound(a, opts.closure_max_iterations));
}


/*
 * full_transition_table - one row per declared state, rows sorted by state
 */
template <ordered_automaton A>
transition_table_of<A>
full_transition_table(const A &a)
{
	auto delta = transition_of(a);
	auto vocabulary = a.vocabulary;
	std::sort(vocabulary.begin(), vocabulary.end());
	auto states = a.states;
	std::sort(states.begin(), states.end());

	transition_table_of<A> result(vocabulary);
	for (const auto &s: states)
		result.add_row(s, destinations_from(delta, vocabulary, s));
	return result;
}


/*
 * table_states - all states that have a row, in row order
 */
template <ordered_state_type St, symbol_type Sy>
std::vector<St>
table_states(const transition_table<St, Sy> &table)
{
	std::vector<St> result;
	result.reserve(table.size());
	for (const auto &row: table.rows())
		result.push_back(row.first);
	return result;
}


/*
 * table_destinations - all destinations of a table, in order of appearance
 */
template <ordered_state_type St, symbol_type Sy>
std::vector<St>
table_destinations(const transition_table<St, Sy> &table)
{
	std::vector<St> result;
	for (const auto &row: table.rows())
		for (const auto &d: row.second)
			result.push_back(d);
	return unique_in_order(result);
}


/*
 * to_triples - flatten a table into its sorted triple relation
 */
template <ordered_state_type St, ordered_symbol_type Sy>
std::vector<transition_triple<St, Sy>>
to_triples(const transition_table<St, Sy> &table)
{
	std::vector<transition_triple<St, Sy>> result;
	result.reserve(table.size() * table.vocabulary().size());
	for (const auto &[state, destinations]: table.rows())
		for (size_t i = 0; i < destinations.size(); ++i)
			result.push_back({state, table.vocabulary()[i], destinations[i]});
	std::sort(result.begin(), result.end());
	return result;
}


/*
 * full_triple_relation - every (state, symbol) pair mapped through the transition
 *
 * The result is sorted by origin, then symbol.
 */
template <ordered_automaton A>
std::vector<transition_triple_of<A>>
full_triple_relation(const A &a)
{
	std::vector<transition_triple_of<A>> result;
	result.reserve(a.states.size() * a.vocabulary.size());
	for (const auto &s: a.states)
		for (const auto &y: a.vocabulary)
			result.push_back({s, y, a.next(s, y)});
	std::sort(result.begin(), result.end());
	return result;
}


/*
 * from_table - function form automaton that looks up transitions in triples
 *
 * The lookup is a linear scan over triples for the first entry that matches
 * (state, symbol). If there is none, the policy decides. strict throws
 * incomplete_transition_table. last_triple_fallback logs a warning and answers
 * with the destination of the last triple. An empty relation always throws.
 */
template <state_type St, symbol_type Sy>
dfa<St, Sy>
from_table(
		std::vector<Sy> vocabulary,
		std::vector<St> states,
		St start,
		std::vector<St> finals,
		std::vector<transition_triple<St, Sy>> triples,
		table_lookup_policy policy = table_lookup_policy::strict)
{
	auto relation = std::make_shared<const std::vector<transition_triple<St, Sy>>>(std::move(triples));

	auto lookup = [relation, policy](const St &state, const Sy &symbol) -> St {
		for (const auto &t: *relation)
			if (t.origin == state && t.symbol == symbol)
				return t.destination;

		if (policy == table_lookup_policy::last_triple_fallback && !relation->empty()) {
			log_warning("from_table: no transition for lookup, falling back to last triple\n");
			return relation->back().destination;
		}
		log_error("from_table: no transition for lookup\n");
		throw incomplete_transition_table("No triple matches the requested state and symbol.");
	};

	return dfa<St, Sy> {
		.vocabulary = std::move(vocabulary),
		.states     = std::move(states),
		.start      = std::move(start),
		.finals     = std::move(finals),
		.delta      = std::move(lookup),
	};
}


/*
 * tabulate - tabulated automaton over all declared states
 *
 * Vocabulary, states and finals keep their order. Automata without enumerated
 * states have to use tabulate_reachable.
 */
template <automaton A>
requires ordered_state_type<typename A::state_t>
table_dfa<typename A::state_t, typename A::symbol_t>
tabulate(const A &a)
{
	auto delta = transition_of(a);
	transition_table_of<A> table(a.vocabulary);
	for (const auto &s: a.states)
		table.add_row(s, destinations_from(delta, a.vocabulary, s));

	return {
		.vocabulary = a.vocabulary,
		.states     = a.states,
		.start      = a.start,
		.finals     = a.finals,
		.table      = std::move(table),
	};
}


/*
 * tabulate_reachable - tabulated automaton over the states reachable from start
 *
 * States are in discovery order of to_table, the vocabulary is sorted. Final
 * states that are not reachable are dropped.
 */
template <ordered_automaton A>
table_dfa<typename A::state_t, typename A::symbol_t>
tabulate_reachable(const A &a, size_t max_iterations)
{
	auto table = to_table(a, max_iterations);
	auto states = table_states(table);

	std::vector<typename A::state_t> finals;
	for (const auto &f: a.finals)
		if (table.has_row(f))
			finals.push_back(f);

	return {
		.vocabulary = table.vocabulary(),
		.states     = std::move(states),
		.start      = a.start,
		.finals     = std::move(finals),
		.table      = std::move(table),
	};
}


template <ordered_automaton A>
table_dfa<typename A::state_t, typename A::symbol_t>
tabulate_reachable(const A &a)
{
	return tabulate_reachable(a, closure_bound(a));
}


template <ordered_automaton A>
table_dfa<typename A::state_t, typename A::symbol_t>
tabulate_reachable(const A &a, const dfa_options &opts)
{
	return tabulate_reachable(a, closure_bound(a, opts.closure_max_iterations));
}


/*
 * to_dfa - function form of a tabulated automaton
 *
 * The transition shares ownership of a copy of the table.
 */
template <ordered_state_type St, symbol_type Sy>
dfa<St, Sy>
to_dfa(const table_dfa<St, Sy> &a)
{
	auto tabulated = std::make_shared<const table_dfa<St, Sy>>(a);
	return dfa<St, Sy> {
		.vocabulary = a.vocabulary,
		.states     = a.states,
		.start      = a.start,
		.finals     = a.finals,
		.delta      = [tabulated](const St &s, const Sy &y) { return tabulated->next(s, y); },
	};
}


} // dfakit::
