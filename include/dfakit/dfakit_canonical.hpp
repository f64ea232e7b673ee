/*
 * dfakit_canonical - canonical renaming of automaton states
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * Renaming numbers the states of an automaton in a deterministic discovery
 * order. Two automata that are equal up to a bijection on their states are
 * renamed into identical automata. For minimal automata, this decides language
 * equivalence.
 */
#pragma once

#include <algorithm>
#include <concepts>
#include <compare>
#include <cstddef>
#include <map>
#include <memory>
#include <ostream>
#include <variant>
#include <vector>

#include <dfakit/dfakit_dfa.hpp>
#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_table.hpp>
#include <dfakit/dfakit_utils.hpp>

namespace dfakit {


/*
 * rename - number the reachable states starting at initial_id
 *
 * The start state is initial_id. All other states are numbered in the order in
 * which they first appear as destinations when reading the rows of to_table
 * from first to last, each from first to last symbol. Unreachable states are
 * dropped. The result has a sorted vocabulary, sorted integer states and
 * sorted finals, and its rows are in the order of their numbers.
 */
template <ordered_automaton A>
table_dfa<int, typename A::symbol_t>
rename(const A &a, int initial_id, size_t max_iterations)
{
	using St = typename A::state_t;
	using Sy = typename A::symbol_t;

	auto table = to_table(a, max_iterations);

	std::map<St, int> ids;
	int next_id = initial_id;
	ids.emplace(a.start, next_id++);
	for (const auto &[state, destinations]: table.rows())
		for (const auto &d: destinations)
			if (ids.emplace(d, next_id).second)
				++next_id;

	// rows ordered by their new number
	std::vector<std::pair<int, std::vector<int>>> rows;
	rows.reserve(table.size());
	for (const auto &[state, destinations]: table.rows()) {
		std::vector<int> renamed;
		renamed.reserve(destinations.size());
		for (const auto &d: destinations)
			renamed.push_back(ids.at(d));
		rows.emplace_back(ids.at(state), std::move(renamed));
	}
	std::sort(rows.begin(), rows.end());

	transition_table<int, Sy> renamed_table(table.vocabulary());
	std::vector<int> states;
	for (auto &[id, destinations]: rows) {
		states.push_back(id);
		renamed_table.add_row(id, std::move(destinations));
	}

	std::vector<int> finals;
	for (const auto &f: a.finals) {
		auto it = ids.find(f);
		if (it != ids.end())
			finals.push_back(it->second);
	}
	canonicalize(finals);

	log_debug("rename: ", states.size(), " states numbered from ", initial_id, "\n");

	return {
		.vocabulary = table.vocabulary(),
		.states     = std::move(states),
		.start      = initial_id,
		.finals     = std::move(finals),
		.table      = std::move(renamed_table),
	};
}


template <ordered_automaton A>
table_dfa<int, typename A::symbol_t>
rename(const A &a, int initial_id)
{
	return rename(a, initial_id, closure_bound(a));
}


/*
 * beautify - rename with numbers starting at 1
 */
template <ordered_automaton A>
table_dfa<int, typename A::symbol_t>
beautify(const A &a)
{
	return rename(a, 1);
}


/*
 * beautify - rename with the first number and closure bound taken from the options
 */
template <ordered_automaton A>
table_dfa<int, typename A::symbol_t>
beautify(const A &a, const dfa_options &opts)
{
	return rename(a, opts.rename_initial_id, closure_bound(a, opts.closure_max_iterations));
}


/*
 * is_isomorphic - test if two automata are equal up to renaming of states
 *
 * Only states reachable from the respective start states are compared.
 */
template <ordered_automaton A, ordered_automaton B>
requires std::same_as<typename A::symbol_t, typename B::symbol_t>
bool
is_isomorphic(const A &a, const B &b)
{
	return beautify(a) == beautify(b);
}


/*
 * dead_sentinel - stand-in for the empty set of states
 *
 * Automata whose states are sets of states, e.g. from a subset construction,
 * use the empty set as trap state. Numbering this state would make it look like
 * any other state, so it is kept apart as sentinel.
 */
struct dead_sentinel
{
	auto operator<=>(const dead_sentinel &) const = default;
};

using sentinel_state = std::variant<int, dead_sentinel>;


inline bool
is_sentinel(const sentinel_state &s)
{
	return std::holds_alternative<dead_sentinel>(s);
}


inline std::ostream&
operator<<(std::ostream &os, const sentinel_state &s)
{
	if (is_sentinel(s))
		return os << "dead";
	return os << std::get<int>(s);
}


/*
 * state_set_type - states that are collections of states with an empty value
 */
template <typename T>
concept state_set_type = ordered_state_type<T>
	&& std::default_initializable<T>
	&& requires(const T &t) { { t.empty() } -> std::convertible_to<bool>; };


/*
 * beautify_with_sentinel - number set-valued states, keep the empty set apart
 *
 * Every non-empty state is numbered from 1 in the order of the automaton's
 * states. The empty state maps to dead_sentinel, which always appears as last
 * state of the result, whether or not the automaton declares the empty state.
 * The sentinel has no transitions of its own and loops to itself on every
 * symbol, so the result is complete even if the automaton has no row for the
 * empty state.
 *
 * Throws malformed_automaton if a start, final or destination state is neither
 * declared nor empty.
 */
template <automaton A>
requires state_set_type<typename A::state_t> && symbol_type<typename A::symbol_t>
dfa<sentinel_state, typename A::symbol_t>
beautify_with_sentinel(const A &a)
{
	using St = typename A::state_t;
	using Sy = typename A::symbol_t;

	auto mapping = std::make_shared<std::map<St, int>>();
	auto originals = std::make_shared<std::map<int, St>>();

	std::vector<sentinel_state> states;
	int next_id = 1;
	for (const auto &s: a.states) {
		if (s.empty() || mapping->contains(s))
			continue;
		mapping->emplace(s, next_id);
		originals->emplace(next_id, s);
		states.push_back(next_id++);
	}
	states.push_back(dead_sentinel{});

	auto to_sentinel_state = [mapping](const St &s) -> sentinel_state {
		if (s.empty())
			return dead_sentinel{};
		auto it = mapping->find(s);
		if (it == mapping->end()) {
			log_error("beautify_with_sentinel: state not declared\n");
			throw malformed_automaton(dfa_validation_flags::TRANSITION_TARGET_UNKNOWN);
		}
		return it->second;
	};

	auto from_state_number = [originals](int id) -> const St& {
		auto it = originals->find(id);
		if (it == originals->end()) {
			log_error("beautify_with_sentinel: unknown state number ", id, "\n");
			throw incomplete_transition_table("Unknown state number.");
		}
		return it->second;
	};

	if (!a.start.empty() && !mapping->contains(a.start)) {
		log_error("beautify_with_sentinel: start state not declared\n");
		throw malformed_automaton(dfa_validation_flags::START_STATE_UNKNOWN);
	}
	std::vector<sentinel_state> finals;
	for (const auto &f: a.finals) {
		if (!f.empty() && !mapping->contains(f)) {
			log_error("beautify_with_sentinel: final state not declared\n");
			throw malformed_automaton(dfa_validation_flags::FINAL_STATE_UNKNOWN);
		}
		finals.push_back(to_sentinel_state(f));
	}

	return dfa<sentinel_state, Sy> {
		.vocabulary = a.vocabulary,
		.states     = std::move(states),
		.start      = to_sentinel_state(a.start),
		.finals     = std::move(finals),
		.delta      = [a, to_sentinel_state, from_state_number](const sentinel_state &s, const Sy &y) -> sentinel_state {
			if (is_sentinel(s))
				return s;
			return to_sentinel_state(a.next(from_state_number(std::get<int>(s)), y));
		},
	};
}


} // dfakit::
