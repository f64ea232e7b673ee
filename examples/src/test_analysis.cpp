#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

// configuration happens in shared.hpp
#include "shared.hpp"

#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_automata.hpp>

namespace dfakit {
	DFAKIT_LOG_DECLARATION(new logger_policy_stdcout());
}

using namespace dfakit;


/*
 * 1 moves to the final state 2 on a and to the trap 3 on b. 2 loops on all
 * symbols, as does 3.
 */
static table_dfa<int, char>
three_states()
{
	return make_table_dfa<int, char>(
			{'a', 'b'},
			{1, 2, 3},
			1,
			{2},
			{
				{1, {2, 3}},
				{2, {2, 2}},
				{3, {3, 3}},
			});
}


/*
 * three_states with two additional non-final states 4 and 5 that swap on every
 * symbol. Both are dead, but neither is sync.
 */
static table_dfa<int, char>
five_states()
{
	return make_table_dfa<int, char>(
			{'a', 'b'},
			{1, 2, 3, 4, 5},
			1,
			{2},
			{
				{1, {2, 3}},
				{2, {2, 2}},
				{3, {3, 3}},
				{4, {5, 5}},
				{5, {4, 4}},
			});
}


int
main()
{
	// sync and dead detection
	{
		auto a = three_states();
		auto delta = transition_of(a);

		CHECK((sync_states(a) == std::vector<int>{3}));
		CHECK((dead_states(a) == std::vector<int>{3}));

		CHECK(is_sync(delta, a.vocabulary, a.finals, 3));
		CHECK(!is_sync(delta, a.vocabulary, a.finals, 2));
		CHECK(!is_sync(delta, a.vocabulary, a.finals, 1));
		CHECK(is_dead(delta, a.vocabulary, a.finals, 3));
		CHECK(!is_dead(delta, a.vocabulary, a.finals, 1));
		CHECK(!is_dead(delta, a.vocabulary, a.finals, 2));
	}

	// every sync state is dead, not every dead state is sync
	{
		auto a = five_states();
		CHECK((dead_states(a) == std::vector<int>{3, 4, 5}));
		CHECK((sync_states(a) == std::vector<int>{3}));
		for (auto s: sync_states(a))
			CHECK(contains(dead_states(a), s));
	}

	// graph metrics
	{
		auto a = five_states();
		CHECK(dfakit::size(a) == 5);
		CHECK((nodes_and_edges(a) == std::pair<size_t, size_t>{5, 10}));
		CHECK((nodes_and_edges_excluding_trap_states(a) == std::pair<size_t, size_t>{2, 3}));
		CHECK(cyclomatic_complexity(a) == 3);

		auto delta = transition_of(a);
		CHECK(incoming_arrow_count(delta, a.vocabulary, a.states, 2) == 3);
		CHECK(incoming_arrow_count(delta, a.vocabulary, a.states, 3) == 3);
		CHECK(incoming_arrow_count(delta, a.vocabulary, a.states, 1) == 0);
		CHECK(incoming_arrow_count(delta, a.vocabulary, a.states, 4) == 2);
		CHECK(outgoing_arrow_count(delta, a.vocabulary, 1) == 2);
		CHECK(outgoing_arrow_count(delta, a.vocabulary, 3) == 2);
	}

	// an automaton without traps
	{
		auto a = make_dfa<int, char>({'0', '1'}, {0, 1, 2}, 0, {0},
				[](const int &s, const char &bit) { return (2 * s + (bit - '0')) % 3; });
		CHECK(dead_states(a).empty());
		CHECK(sync_states(a).empty());
		CHECK((nodes_and_edges_excluding_trap_states(a) == nodes_and_edges(a)));
		CHECK(cyclomatic_complexity(a) == 5);
	}

	// complement flips acceptance and is an involution
	{
		auto a = five_states();
		auto c = complement(a);
		CHECK((c.finals == std::vector<int>{1, 3, 4, 5}));
		CHECK(c.states == a.states);
		CHECK(c.start == a.start);
		CHECK(c.table == a.table);
		CHECK(complement(c) == a);

		for (auto w: {"", "a", "b", "ab", "ba", "aab", "bba"})
			CHECK(accepts(c, std::string(w)) != accepts(a, std::string(w)));

		// the final state of a becomes the only trap of c
		CHECK((dead_states(c) == std::vector<int>{2}));
		CHECK((sync_states(c) == std::vector<int>{2}));
	}

	// function form gives the same results as the tabulated form
	{
		auto t = five_states();
		auto f = to_dfa(t);
		CHECK(dead_states(f) == dead_states(t));
		CHECK(sync_states(f) == sync_states(t));
		CHECK(cyclomatic_complexity(f) == cyclomatic_complexity(t));
	}

	// structured export
	{
		auto a = three_states();
		auto e = export_dfa(a);
		CHECK(e.vocabulary == a.vocabulary);
		CHECK(e.states == a.states);
		CHECK(e.start == 1);
		CHECK((e.finals == std::vector<int>{2}));
		CHECK(e.transitions.size() == 6);
		CHECK((e.transitions[1] == transition_triple<int, char>{1, 'b', 3}));
		CHECK(e == export_dfa(to_dfa(a)));
	}

	return TEST_RESULT();
}
