#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
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
 * divisible by three, with an additional state 3 that is not reachable from 0.
 * The vocabulary is deliberately not sorted.
 */
static dfa<int, char>
divisible_by_three_with_detour()
{
	return make_dfa<int, char>(
			{'1', '0'},
			{0, 1, 2, 3},
			0,
			{0},
			[](const int &s, const char &bit) { return (2 * s + (bit - '0')) % 3; });
}


template <typename A, typename B>
static bool
same_transitions(const A &a, const B &b)
{
	for (auto &s: a.states)
		for (auto &y: a.vocabulary)
			if (a.next(s, y) != b.next(s, y))
				return false;
	return true;
}


int
main()
{
	auto a = divisible_by_three_with_detour();

	// only reachable states get rows, in discovery order, over a sorted vocabulary
	{
		auto table = to_table(a);
		CHECK((table.vocabulary() == std::vector<char>{'0', '1'}));
		CHECK((table_states(table) == std::vector<int>{0, 1, 2}));
		CHECK(!table.has_row(3));
		CHECK((table.row(0) == std::vector<int>{0, 1}));
		CHECK((table.row(1) == std::vector<int>{2, 0}));
		CHECK((table.row(2) == std::vector<int>{1, 2}));
		CHECK((table_destinations(table) == std::vector<int>{0, 1, 2}));
		CHECK(table.lookup(1, '0') == 2);
		CHECK_THROWS(table.row(3), incomplete_transition_table);
		CHECK_THROWS(table.lookup(0, 'x'), incomplete_transition_table);
		CHECK(to_triples(table).size() == 6);
	}

	// all declared states
	{
		auto table = full_transition_table(a);
		CHECK(table.size() == 4);
		CHECK((table_states(table) == std::vector<int>{0, 1, 2, 3}));
		CHECK((table.row(3) == std::vector<int>{0, 1}));

		auto triples = full_triple_relation(a);
		CHECK(triples.size() == 8);
		CHECK(std::is_sorted(triples.begin(), triples.end()));
		CHECK((triples.front() == transition_triple<int, char>{0, '0', 0}));
		CHECK((triples.back() == transition_triple<int, char>{3, '1', 1}));
		CHECK(triples == to_triples(table));
	}

	// round trip through the triple relation
	{
		auto b = from_table(a.vocabulary, a.states, a.start, a.finals, full_triple_relation(a));
		CHECK(same_transitions(a, b));
		CHECK(validate(b) == dfa_validation_flags::IS_DFA);
		for (auto w: {"", "0", "11", "101", "110", "1001"})
			CHECK(accepts(b, std::string(w)) == accepts(a, std::string(w)));
	}

	// partial relations, strict and legacy lookup
	{
		std::vector<transition_triple<int, char>> partial = {
			{0, '0', 0}, {0, '1', 1},
			{1, '0', 2}, {1, '1', 0},
		};
		auto strict = from_table(a.vocabulary, std::vector<int>{0, 1, 2}, 0, std::vector<int>{0}, partial);
		CHECK(strict.next(1, '0') == 2);
		CHECK_THROWS(strict.next(2, '0'), incomplete_transition_table);
		CHECK(test(validate(strict) & dfa_validation_flags::TRANSITION_MISSING));

		auto legacy = from_table(a.vocabulary, std::vector<int>{0, 1, 2}, 0, std::vector<int>{0}, partial,
				table_lookup_policy::last_triple_fallback);
		CHECK(legacy.next(1, '0') == 2);
		CHECK(legacy.next(2, '0') == 0);
		CHECK(legacy.next(2, '1') == 0);

		auto empty = from_table(a.vocabulary, std::vector<int>{0}, 0, std::vector<int>{0},
				std::vector<transition_triple<int, char>>{},
				table_lookup_policy::last_triple_fallback);
		CHECK_THROWS(empty.next(0, '0'), incomplete_transition_table);
	}

	// tabulated forms
	{
		auto t = tabulate(a);
		CHECK(t.states == a.states);
		CHECK(t.vocabulary == a.vocabulary);
		CHECK(same_transitions(a, t));
		CHECK(validate(t) == dfa_validation_flags::IS_DFA);

		auto r = tabulate_reachable(a);
		CHECK((r.states == std::vector<int>{0, 1, 2}));
		CHECK((r.vocabulary == std::vector<char>{'0', '1'}));
		CHECK((r.finals == std::vector<int>{0}));
		CHECK(same_transitions(r, a));

		auto f = to_dfa(t);
		CHECK(same_transitions(a, f));
		CHECK(tabulate(f) == t);
	}

	// table construction errors
	{
		transition_table<int, char> table({'a', 'b'});
		table.add_row(0, {0, 1});
		CHECK_THROWS(table.add_row(1, {0}), std::invalid_argument);
		CHECK_THROWS(table.add_row(0, {1, 1}), std::invalid_argument);
		CHECK(table.size() == 1);

		auto missing_row = [] {
			return make_table_dfa<int, char>({'a'}, {0, 1}, 0, {1}, {{0, {1}}});
		};
		bool thrown = false;
		try {
			missing_row();
		}
		catch (const malformed_automaton &e) {
			thrown = true;
			CHECK(test(e.flags & dfa_validation_flags::TRANSITION_MISSING));
		}
		CHECK(thrown);
	}

	// rows that do not fit the vocabulary, or repeat a state
	{
		auto short_row = [] {
			return make_table_dfa<int, char>({'a', 'b'}, {0}, 0, {0}, {{0, {0}}});
		};
		CHECK_THROWS(short_row(), malformed_automaton);

		dfa_options unchecked;
		unchecked.validate_on_construction = false;
		auto repeated_row = [&unchecked] {
			return make_table_dfa<int, char>({'a'}, {0}, 0, {0},
					{{0, {0}}, {0, {0}}}, unchecked);
		};

		dfa_validation_flags flags = dfa_validation_flags::IS_DFA;
		try {
			repeated_row();
		}
		catch (const malformed_automaton &e) {
			flags = e.flags;
		}
		CHECK(test(flags & dfa_validation_flags::DUPLICATE_STATE));
		CHECK(!test(flags & dfa_validation_flags::ROW_LENGTH_MISMATCH));

		CHECK((validate_rows<int, char>({'a', 'b'}, {{0, {0, 0}}, {1, {1}}})
				== dfa_validation_flags::ROW_LENGTH_MISMATCH));
		CHECK(dfa_validation_flags_to_str(dfa_validation_flags::ROW_LENGTH_MISMATCH
				| dfa_validation_flags::DUPLICATE_STATE) == "DUPLICATE_STATE | ROW_LENGTH_MISMATCH");
	}

	return TEST_RESULT();
}
