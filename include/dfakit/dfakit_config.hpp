/*
 * dfakit_config - configuration variables of dfakit
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * Programs that use dfakit register the library's cvars in their cvar_map,
 * optionally execute a configuration file such as
 *
 *     // etc/dfakit.cfg
 *     set dfa_validate_on_construction true;
 *     set dfa_table_lookup "fallback";
 *     set dfa_closure_max_iterations 1024;
 *
 * and finally turn the cvars into a dfa_options value that is passed to the
 * functions which accept one.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <dfakit/dfakit_cmd.hpp>
#include <dfakit/dfakit_cvar.hpp>
#include <dfakit/dfakit_dfa.hpp>
#include <dfakit/dfakit_fixpoint.hpp>
#include <dfakit/dfakit_log.hpp>

namespace dfakit {


/*
 * names of all cvars of dfakit, together with their defaults
 */
#define DFAKIT_CONFIG_CVARS(_) \
	_(dfa_validate_on_construction, true)                                           \
	_(dfa_table_lookup,             "strict")                                       \
	_(dfa_closure_max_iterations,   static_cast<unsigned>(default_closure_max_iterations)) \
	_(dfa_rename_initial_id,        1)


/*
 * register_dfa_cvars - register all cvars of dfakit with their defaults
 *
 * Returns false if at least one of the names was registered before.
 */
inline bool
register_dfa_cvars(cvar_map &cvars)
{
	bool result = true;
	#define DFAKIT_REGISTER_CVAR(NAME, DEFAULT) \
		if (!cvars.register_cvar(#NAME, DEFAULT)) \
			result = false;
	DFAKIT_CONFIG_CVARS(DFAKIT_REGISTER_CVAR)
	#undef DFAKIT_REGISTER_CVAR
	return result;
}


/*
 * table_lookup_policy_from_str - "strict" or "fallback"
 */
inline std::optional<table_lookup_policy>
table_lookup_policy_from_str(const std::string &str)
{
	if (str == "strict")
		return table_lookup_policy::strict;
	if (str == "fallback")
		return table_lookup_policy::last_triple_fallback;
	return {};
}


/*
 * load_dfa_options - read dfa_options from the cvars
 *
 * Values of cvars that are not registered, or that cannot be interpreted, keep
 * the defaults of dfa_options. Each such case is logged.
 */
inline dfa_options
load_dfa_options(const cvar_map &cvars)
{
	dfa_options opts;

	if (auto c = cvars.get("dfa_validate_on_construction"))
		opts.validate_on_construction = c->as_boolean();
	else
		log_warning("cvar \"dfa_validate_on_construction\" not registered, using default.\n");

	if (auto c = cvars.get("dfa_table_lookup")) {
		auto policy = table_lookup_policy_from_str(c->as_string());
		if (policy)
			opts.table_lookup = *policy;
		else
			log_error("Invalid value \"", c->as_string(), "\" for cvar \"dfa_table_lookup\", using \"strict\".\n");
	}
	else
		log_warning("cvar \"dfa_table_lookup\" not registered, using default.\n");

	if (auto c = cvars.get("dfa_closure_max_iterations"))
		opts.closure_max_iterations = c->as_unsigned();
	else
		log_warning("cvar \"dfa_closure_max_iterations\" not registered, using default.\n");

	if (auto c = cvars.get("dfa_rename_initial_id"))
		opts.rename_initial_id = c->as_integer();
	else
		log_warning("cvar \"dfa_rename_initial_id\" not registered, using default.\n");

	return opts;
}


/*
 * register_set_cmd - register the command "set <cvar> <value>"
 *
 * The command refers to cvars, which must outlive cmds.
 */
inline cmd_status
register_set_cmd(cmds &commands, cvar_map &cvars)
{
	return commands.register_cmd("set", [&cvars](std::vector<std::string> argv) {
		if (argv.size() != 2) {
			log_error("Command \"set\" expects 2 arguments, got ", argv.size(), ".\n");
			return;
		}
		auto *cvar = cvars.get(argv[0]);
		if (!cvar) {
			log_warning("Cannot set unknown cvar \"", argv[0], "\".\n");
			return;
		}
		if (parse(argv[1], cvar) != cvar_status::success)
			log_warning("Keeping previous value of cvar \"", argv[0], "\".\n");
	});
}


/*
 * load_config_file - execute a configuration file on the cvars
 *
 * Registers the "set" command on demand.
 */
inline cmd_status
load_config_file(cvar_map &cvars, cmds &commands, const std::string &filename)
{
	if (!commands.find("set")) {
		auto status = register_set_cmd(commands, cvars);
		if (status != cmd_status::Success)
			return status;
	}

	log_debug("Loading configuration file \"", filename, "\".\n");
	return commands.execute_file(filename);
}


#undef DFAKIT_CONFIG_CVARS

} // dfakit::
