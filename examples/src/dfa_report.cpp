/*
 * dfa_report - print the structural analysis of a small automaton
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * Usage: dfa_report [config-file]
 *
 * The automaton accepts words over {a, b} that start with "ab". Its state 'x'
 * is a trap, and state 'u' cannot be reached.
 */
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

// configuration happens in shared.hpp
#include "shared.hpp"

#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_cvar.hpp>
#include <dfakit/dfakit_cmd.hpp>
#include <dfakit/dfakit_config.hpp>
#include <dfakit/dfakit_automata.hpp>

namespace dfakit {
	DFAKIT_LOG_DECLARATION(new logger_policy_stdcout());
}

using namespace dfakit;


template <typename T>
void
print_list(const std::string &name, const std::vector<T> &xs)
{
	std::cout << name << ": {";
	for (size_t i = 0; i < xs.size(); i++)
		std::cout << (i > 0 ? ", " : "") << xs[i];
	std::cout << "}\n";
}


static table_dfa<char, char>
starts_with_ab(const dfa_options &opts)
{
	return make_table_dfa<char, char>(
			{'a', 'b'},
			{'s', 'p', 'f', 'x', 'u'},
			's',
			{'f'},
			{
				{'s', {'p', 'x'}},
				{'p', {'x', 'f'}},
				{'f', {'f', 'f'}},
				{'x', {'x', 'x'}},
				{'u', {'f', 's'}},
			},
			opts);
}


int
main(int argc, char *argv[])
{
	cvar_map cvars;
	if (!register_dfa_cvars(cvars))
		return EXIT_FAILURE;

	cmds commands;
	if (argc > 1) {
		auto status = load_config_file(cvars, commands, argv[1]);
		if (status != cmd_status::Success) {
			log_error("Could not load configuration file \"", argv[1], "\".\n");
			return EXIT_FAILURE;
		}
	}
	auto opts = load_dfa_options(cvars);

	table_dfa<char, char> a = starts_with_ab(opts);
	print_list("states", a.states);
	print_list("reachable", reachable_states(a));
	print_list("unreachable", unreachable_states(a));
	print_list("dead", dead_states(a));
	print_list("sync", sync_states(a));

	auto [nodes, edges] = nodes_and_edges(a);
	auto [live_nodes, live_edges] = nodes_and_edges_excluding_trap_states(a);
	std::cout << "nodes/edges: " << nodes << "/" << edges
		<< ", without traps: " << live_nodes << "/" << live_edges << "\n";
	std::cout << "cyclomatic complexity: " << cyclomatic_complexity(a) << "\n";

	for (auto w: {"ab", "abba", "ba", ""})
		std::cout << "accepts(\"" << w << "\") = " << std::boolalpha << accepts(a, std::string(w)) << "\n";

	auto b = beautify(a, opts);
	std::cout << "canonical transitions:\n";
	for (const auto &t: export_dfa(b).transitions)
		std::cout << "  " << t.origin << " --" << t.symbol << "--> " << t.destination << "\n";

	CHECK(is_isomorphic(a, b));
	CHECK(accepts(b, std::string("abab")));
	CHECK(!accepts(b, std::string("ba")));
	return TEST_RESULT();
}
