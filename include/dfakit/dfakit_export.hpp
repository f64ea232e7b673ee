/*
 * dfakit_export - structured export of an automaton
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * dfa_export is a plain value for sinks that print, plot, or persist automata.
 * dfakit itself does not format it.
 */
#pragma once

#include <vector>

#include <dfakit/dfakit_dfa.hpp>
#include <dfakit/dfakit_table.hpp>

namespace dfakit {


template <state_type St, symbol_type Sy>
struct dfa_export
{
	std::vector<Sy>                        vocabulary;
	std::vector<St>                        states;
	St                                     start;
	std::vector<St>                        finals;
	std::vector<transition_triple<St, Sy>> transitions;

	bool operator==(const dfa_export &other) const = default;
};


/*
 * export_dfa - collect all parts of an automaton with enumerated states
 *
 * Transitions are the full triple relation, sorted by origin and symbol.
 */
template <ordered_automaton A>
dfa_export<typename A::state_t, typename A::symbol_t>
export_dfa(const A &a)
{
	return {
		.vocabulary  = a.vocabulary,
		.states      = a.states,
		.start       = a.start,
		.finals      = a.finals,
		.transitions = full_triple_relation(a),
	};
}


} // dfakit::
