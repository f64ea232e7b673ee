/*
 * dfakit_dfa - Deterministic Finite Automata over arbitrary state and symbol types
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * An automaton is a tuple (vocabulary, states, start, finals, transition). It
 * exists in two forms. The function form dfa<St, Sy> computes transitions with
 * a callable. The tabulated form table_dfa<St, Sy> looks them up in an explicit
 * transition_table. Both satisfy the automaton concept, which is all that the
 * algorithms in dfakit_reachability.hpp, dfakit_table.hpp, dfakit_canonical.hpp
 * and dfakit_analysis.hpp require. Conversions between both forms are in
 * dfakit_table.hpp.
 *
 * Automata are treated as values. No algorithm modifies its input, and every
 * transformation returns a new automaton.
 */
#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <ranges>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <dfakit/dfakit_fixpoint.hpp>
#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_utils.hpp>

namespace dfakit {


/*
 * States and symbols need equality only. Building tables, renaming, and
 * everything else that needs a canonical order additionally requires a total
 * order.
 */
template <typename T>
concept state_type = std::copyable<T> && std::equality_comparable<T>;

template <typename T>
concept ordered_state_type = state_type<T> && std::totally_ordered<T>;

template <typename T>
concept symbol_type = std::copyable<T> && std::equality_comparable<T>;

template <typename T>
concept ordered_symbol_type = symbol_type<T> && std::totally_ordered<T>;


/*
 * automaton - anything that exposes the five components of a DFA
 */
template <typename A>
concept automaton = requires(const A &a, const typename A::state_t &s, const typename A::symbol_t &y)
{
	requires state_type<typename A::state_t>;
	requires symbol_type<typename A::symbol_t>;
	{ a.vocabulary } -> std::convertible_to<std::vector<typename A::symbol_t>>;
	{ a.states     } -> std::convertible_to<std::vector<typename A::state_t>>;
	{ a.start      } -> std::convertible_to<typename A::state_t>;
	{ a.finals     } -> std::convertible_to<std::vector<typename A::state_t>>;
	{ a.next(s, y) } -> std::convertible_to<typename A::state_t>;
};

template <typename A>
concept ordered_automaton = automaton<A>
	&& ordered_state_type<typename A::state_t>
	&& ordered_symbol_type<typename A::symbol_t>;


/*
 * transition_function - a callable (St, Sy) -> St
 */
template <typename F, typename St, typename Sy>
concept transition_function = std::regular_invocable<const F&, const St&, const Sy&>
	&& std::convertible_to<std::invoke_result_t<const F&, const St&, const Sy&>, St>;


/*
 * incomplete_transition_table - a lookup found no entry for (state, symbol)
 */
struct incomplete_transition_table : std::out_of_range
{
	using std::out_of_range::out_of_range;
};


#define DFAKIT_DFA_VALIDATION_FLAGS(_) \
	_(dfa_validation_flags, IS_DFA                   , (0 << 0)) \
	_(dfa_validation_flags, MISSING_STATES           , (1 << 0)) \
	_(dfa_validation_flags, START_STATE_UNKNOWN      , (1 << 1)) \
	_(dfa_validation_flags, FINAL_STATE_UNKNOWN      , (1 << 2)) \
	_(dfa_validation_flags, TRANSITION_TARGET_UNKNOWN, (1 << 3)) \
	_(dfa_validation_flags, TRANSITION_MISSING       , (1 << 4)) \
	_(dfa_validation_flags, DUPLICATE_STATE          , (1 << 5)) \
	_(dfa_validation_flags, DUPLICATE_SYMBOL         , (1 << 6)) \
	_(dfa_validation_flags, ROW_LENGTH_MISMATCH      , (1 << 7))

#define DFAKIT_DFA_VALIDATION_FLAGS_LIST_ITEM(TYPE, NAME, VALUE) \
	NAME = VALUE,

enum struct dfa_validation_flags : unsigned {
	DFAKIT_DFA_VALIDATION_FLAGS(DFAKIT_DFA_VALIDATION_FLAGS_LIST_ITEM)
};
DFAKIT_DEFINE_ENUM_FLAG_OPERATORS(dfa_validation_flags)

#undef DFAKIT_DFA_VALIDATION_FLAGS_LIST_ITEM

inline
bool
test(dfa_validation_flags flags)
{
	return to_underlying(flags) != 0;
}


/*
 * dfa_validation_flags_to_str - human readable list of all set flags
 */
inline std::string
dfa_validation_flags_to_str(dfa_validation_flags flags)
{
	if (flags == dfa_validation_flags::IS_DFA)
		return "IS_DFA";

	std::string result;
	#define DFAKIT_DFA_VALIDATION_FLAGS_TO_STR(TYPE, NAME, VALUE) \
		if (to_underlying(TYPE::NAME) && to_underlying(flags & TYPE::NAME)) { \
			if (!result.empty()) \
				result += " | "; \
			result += #NAME; \
		}
	DFAKIT_DFA_VALIDATION_FLAGS(DFAKIT_DFA_VALIDATION_FLAGS_TO_STR)
	#undef DFAKIT_DFA_VALIDATION_FLAGS_TO_STR

	return result;
}


/*
 * malformed_automaton - an automaton violates one of the DFA invariants
 */
struct malformed_automaton : std::invalid_argument
{
	dfa_validation_flags flags;

	explicit malformed_automaton(dfa_validation_flags f)
		: std::invalid_argument("Malformed automaton: " + dfa_validation_flags_to_str(f))
		, flags(f)
	{}
};


/*
 * table_lookup_policy - behavior of a triple lookup that finds no entry
 *
 * strict raises incomplete_transition_table. last_triple_fallback answers with
 * the destination of the last triple of the relation, which silently turns a
 * partial table into a total one.
 */
enum struct table_lookup_policy : unsigned {
	strict,
	last_triple_fallback,
};


/*
 * dfa_options - runtime options of the library, see dfakit_config.hpp
 */
struct dfa_options
{
	bool                validate_on_construction = true;
	table_lookup_policy table_lookup             = table_lookup_policy::strict;
	size_t              closure_max_iterations   = default_closure_max_iterations;
	int                 rename_initial_id        = 1;
};


/*
 * dfa - function form of a deterministic finite automaton
 *
 * The transition is an arbitrary callable. The state set may remain empty for
 * automata whose states are not enumerated, in which case the closures use an
 * external bound (see closure_bound).
 */
template <state_type St, symbol_type Sy>
struct dfa
{
	using state_t       = St;
	using symbol_t      = Sy;
	using transition_fn = std::function<St (const St&, const Sy&)>;

	std::vector<Sy> vocabulary;
	std::vector<St> states;
	St              start;
	std::vector<St> finals;
	transition_fn   delta;

	St
	next(const St &state, const Sy &symbol) const
	{
		return this->delta(state, symbol);
	}
};


/*
 * transition_triple - one edge of the transition graph
 */
template <state_type St, symbol_type Sy>
struct transition_triple
{
	St origin;
	Sy symbol;
	St destination;

	bool operator==(const transition_triple &other) const = default;

	bool
	operator<(const transition_triple &other) const
	requires ordered_state_type<St> && ordered_symbol_type<Sy>
	{
		return std::tie(origin, symbol, destination)
			< std::tie(other.origin, other.symbol, other.destination);
	}
};


/*
 * transition_table - explicit transition relation
 *
 * Every row maps a state to its destinations, one per symbol of the table's
 * vocabulary in vocabulary order. Rows are kept in the order in which they were
 * added, which for tables built by to_table is the discovery order of states.
 */
template <ordered_state_type St, symbol_type Sy>
struct transition_table
{
	using row_t = std::pair<St, std::vector<St>>;

	transition_table() = default;

	explicit transition_table(std::vector<Sy> vocabulary)
		: _vocabulary(std::move(vocabulary))
	{}

	const std::vector<Sy>&
	vocabulary() const
	{
		return this->_vocabulary;
	}

	const std::vector<row_t>&
	rows() const
	{
		return this->_rows;
	}

	size_t
	size() const
	{
		return this->_rows.size();
	}

	bool
	has_row(const St &state) const
	{
		return this->_index.contains(state);
	}

	/*
	 * add_row - append a row for a state
	 *
	 * Throws std::invalid_argument if the row's length does not match the
	 * vocabulary or if the state already has a row.
	 */
	void
	add_row(St state, std::vector<St> destinations)
	{
		if (destinations.size() != this->_vocabulary.size())
			throw std::invalid_argument("Transition table row length does not match vocabulary size.");
		if (this->has_row(state))
			throw std::invalid_argument("Duplicate row in transition table.");

		this->_index.emplace(state, this->_rows.size());
		this->_rows.emplace_back(std::move(state), std::move(destinations));
	}

	/*
	 * row - get the destinations of a state
	 *
	 * Throws incomplete_transition_table if there is no row for the state.
	 */
	const std::vector<St>&
	row(const St &state) const
	{
		auto it = this->_index.find(state);
		if (it == this->_index.end()) {
			log_error("No row for requested state in transition table.\n");
			throw incomplete_transition_table("No row for state in transition table.");
		}
		return this->_rows[it->second].second;
	}

	/*
	 * lookup - destination of a state under a symbol
	 */
	const St&
	lookup(const St &state, const Sy &symbol) const
	{
		auto col = get_index_of(this->_vocabulary, symbol);
		if (!col) {
			log_error("Symbol not in vocabulary of transition table.\n");
			throw incomplete_transition_table("Symbol not in vocabulary of transition table.");
		}
		return this->row(state)[*col];
	}

	bool
	operator==(const transition_table &other) const
	{
		return this->_vocabulary == other._vocabulary && this->_rows == other._rows;
	}

private:
	std::vector<Sy>
		_vocabulary;

	std::vector<row_t>
		_rows;

	std::map<St, size_t>
		_index;
};


/*
 * table_dfa - tabulated form of a deterministic finite automaton
 *
 * The vocabulary of the automaton is the vocabulary of its table.
 */
template <ordered_state_type St, symbol_type Sy>
struct table_dfa
{
	using state_t  = St;
	using symbol_t = Sy;

	std::vector<Sy>              vocabulary;
	std::vector<St>              states;
	St                           start;
	std::vector<St>              finals;
	transition_table<St, Sy>     table;

	St
	next(const St &state, const Sy &symbol) const
	{
		return this->table.lookup(state, symbol);
	}

	bool operator==(const table_dfa &other) const = default;
};


/*
 * closure_bound - iteration bound for closures over the states of an automaton
 *
 * An automaton with enumerated states cannot grow a closure more often than it
 * has states. Otherwise, the fallback bound is used.
 */
template <automaton A>
size_t
closure_bound(const A &a, size_t fallback = default_closure_max_iterations)
{
	return a.states.empty() ? fallback : a.states.size();
}


/*
 * transition_of - the transition of an automaton as a plain callable
 *
 * The callable refers to the automaton, which must outlive it.
 */
template <automaton A>
auto
transition_of(const A &a)
{
	using St = typename A::state_t;
	using Sy = typename A::symbol_t;
	return [&a](const St &s, const Sy &y) -> St { return a.next(s, y); };
}


/*
 * validate - check the invariants of an automaton
 *
 * Returns IS_DFA if the automaton is well formed, or a combination of flags
 * describing all violations that were found. The transition is evaluated for
 * every pair of state and symbol.
 */
template <automaton A>
dfa_validation_flags
validate(const A &a)
{
	using St = typename A::state_t;
	using Sy = typename A::symbol_t;

	dfa_validation_flags result = dfa_validation_flags::IS_DFA;

	if (a.states.empty())
		result |= dfa_validation_flags::MISSING_STATES;
	if (unique_in_order(a.states).size() != a.states.size())
		result |= dfa_validation_flags::DUPLICATE_STATE;
	if (unique_in_order(a.vocabulary).size() != a.vocabulary.size())
		result |= dfa_validation_flags::DUPLICATE_SYMBOL;
	if (!contains(a.states, a.start))
		result |= dfa_validation_flags::START_STATE_UNKNOWN;
	for (const St &f: a.finals)
		if (!contains(a.states, f))
			result |= dfa_validation_flags::FINAL_STATE_UNKNOWN;

	for (const St &s: a.states) {
		for (const Sy &y: a.vocabulary) {
			try {
				if (!contains(a.states, a.next(s, y)))
					result |= dfa_validation_flags::TRANSITION_TARGET_UNKNOWN;
			}
			catch (const incomplete_transition_table &) {
				result |= dfa_validation_flags::TRANSITION_MISSING;
			}
		}
	}

	if (result != dfa_validation_flags::IS_DFA)
		log_debug("validate: ", dfa_validation_flags_to_str(result), "\n");
	return result;
}


/*
 * make_dfa - construct and validate a function form automaton
 *
 * Throws malformed_automaton if validation is enabled and fails.
 */
template <state_type St, symbol_type Sy, typename F>
requires transition_function<F, St, Sy>
dfa<St, Sy>
make_dfa(
		std::vector<Sy> vocabulary,
		std::vector<St> states,
		St start,
		std::vector<St> finals,
		F transition,
		const dfa_options &opts = {})
{
	dfa<St, Sy> result {
		.vocabulary = std::move(vocabulary),
		.states     = std::move(states),
		.start      = std::move(start),
		.finals     = std::move(finals),
		.delta      = std::move(transition),
	};

	if (opts.validate_on_construction) {
		auto flags = validate(result);
		if (flags != dfa_validation_flags::IS_DFA) {
			log_error("make_dfa: ", dfa_validation_flags_to_str(flags), "\n");
			throw malformed_automaton(flags);
		}
	}
	return result;
}


/*
 * validate_rows - check that rows can be stored in a transition table
 *
 * Every row needs one destination per symbol, and no state may have more than
 * one row.
 */
template <ordered_state_type St, symbol_type Sy>
dfa_validation_flags
validate_rows(
		const std::vector<Sy> &vocabulary,
		const std::vector<std::pair<St, std::vector<St>>> &rows)
{
	dfa_validation_flags result = dfa_validation_flags::IS_DFA;
	std::set<St> seen;
	for (auto &[state, destinations]: rows) {
		if (destinations.size() != vocabulary.size())
			result |= dfa_validation_flags::ROW_LENGTH_MISMATCH;
		if (!seen.insert(state).second)
			result |= dfa_validation_flags::DUPLICATE_STATE;
	}
	return result;
}


/*
 * make_table_dfa - construct and validate a tabulated automaton
 *
 * The rows are given in the order in which they are stored, each one with one
 * destination per symbol of vocabulary.
 *
 * Throws malformed_automaton if the rows do not form a table, regardless of
 * opts, or if validation is enabled and fails.
 */
template <ordered_state_type St, symbol_type Sy>
table_dfa<St, Sy>
make_table_dfa(
		std::vector<Sy> vocabulary,
		std::vector<St> states,
		St start,
		std::vector<St> finals,
		const std::vector<std::pair<St, std::vector<St>>> &rows,
		const dfa_options &opts = {})
{
	auto row_flags = validate_rows(vocabulary, rows);
	if (test(row_flags)) {
		log_error("make_table_dfa: ", dfa_validation_flags_to_str(row_flags), "\n");
		throw malformed_automaton(row_flags);
	}

	transition_table<St, Sy> table(vocabulary);
	for (auto &[state, destinations]: rows)
		table.add_row(state, destinations);

	table_dfa<St, Sy> result {
		.vocabulary = std::move(vocabulary),
		.states     = std::move(states),
		.start      = std::move(start),
		.finals     = std::move(finals),
		.table      = std::move(table),
	};

	if (opts.validate_on_construction) {
		auto flags = validate(result);
		if (flags != dfa_validation_flags::IS_DFA) {
			log_error("make_table_dfa: ", dfa_validation_flags_to_str(flags), "\n");
			throw malformed_automaton(flags);
		}
	}
	return result;
}


/*
 * walk - run a transition over an input sequence
 *
 * Returns the state reached after consuming all symbols of the input in order,
 * or start on empty input.
 */
template <typename St, typename F, std::ranges::input_range R>
St
walk(const F &transition, St start, const R &input)
{
	St state = std::move(start);
	for (const auto &symbol: input)
		state = transition(state, symbol);
	return state;
}


/*
 * accepts - test if an automaton accepts an input sequence
 */
template <automaton A, std::ranges::input_range R>
bool
accepts(const A &a, const R &input)
{
	auto final_state = walk(transition_of(a), a.start, input);
	log_verbose("accepts: input consumed\n");
	return contains(a.finals, final_state);
}


namespace detail {

	template <automaton A, typename It, typename End>
	bool
	accepts_from(const A &a, const typename A::state_t &state, It it, End end)
	{
		if (it == end)
			return contains(a.finals, state);
		const typename A::state_t next_state = a.next(state, *it);
		return accepts_from(a, next_state, std::next(it), end);
	}

} // detail::


/*
 * accepts_recursive - symbol by symbol formulation of accepts
 *
 * Consumes the first symbol and continues on the rest of the input from the
 * resulting state. The recursion depth equals the input length.
 */
template <automaton A, std::ranges::forward_range R>
bool
accepts_recursive(const A &a, const R &input)
{
	return detail::accepts_from(a, a.start, std::ranges::begin(input), std::ranges::end(input));
}


} // dfakit::
