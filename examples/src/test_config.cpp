#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

// configuration happens in shared.hpp
#include "shared.hpp"

#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_utils.hpp>
#include <dfakit/dfakit_filesystem.hpp>
#include <dfakit/dfakit_cvar.hpp>
#include <dfakit/dfakit_cmd.hpp>
#include <dfakit/dfakit_config.hpp>
#include <dfakit/dfakit_automata.hpp>

namespace dfakit {
	DFAKIT_LOG_DECLARATION(new logger_policy_stdcout());
}

using namespace dfakit;


static std::string
temp_filename(const std::string &name)
{
	return (std::filesystem::temp_directory_path() / name).string();
}


int
main()
{
	// string conversions used by the cvar system
	CHECK(str_to_type<bool>("true").value_or(false));
	CHECK(!str_to_type<bool>("0").value_or(true));
	CHECK(!str_to_type<bool>("maybe").has_value());
	CHECK(str_to_type<unsigned>("128 ").value_or(0) == 128);
	CHECK(!str_to_type<unsigned>("128abc").has_value());
	CHECK(!str_to_type<unsigned>("-1").has_value());
	CHECK(!str_to_type<unsigned>("  -0").has_value());
	CHECK(str_to_type<int>("-1").value_or(0) == -1);
	CHECK(str_to_type<double>(type_to_str(0.1).value_or("")).value_or(0.0) == 0.1);
	CHECK(str_to_type<double>(type_to_str(1.0 / 3.0).value_or("")).value_or(0.0) == 1.0 / 3.0);
	CHECK(!str_to_type<int>("abc").has_value());
	CHECK(type_to_str(false).value_or("") == "false");
	CHECK(type_to_str(2.5).value_or("") == "2.5");

	// tokenizer and compression
	{
		std::string str = "set a 1; // comment\n/* block\ncomment */ set b \"hello \\\"world\\\"\";";
		cmd_compress(str);
		CHECK(str == "set a 1;set b \"hello \\\"world\\\"\";");

		std::vector<cmd_token> toks;
		CHECK(cmd_tokenize(str, toks) == cmd_status::Success);
		CHECK(toks.size() == 2);
		CHECK(toks[0].name == "set");
		CHECK((toks[0].argv == std::vector<std::string>{"a", "1"}));
		CHECK((toks[1].argv == std::vector<std::string>{"b", "hello \"world\""}));

		// backslashes are escaped, too
		std::vector<cmd_token> escaped;
		CHECK(cmd_tokenize("say \"back\\\\slash\";", escaped) == cmd_status::Success);
		CHECK(escaped.size() == 1 && escaped[0].argv.size() == 1);
		CHECK(escaped[0].argv[0] == "back\\slash");

		std::vector<cmd_token> broken;
		CHECK(cmd_tokenize("set a \"unterminated", broken) == cmd_status::ErrorTokenizerIncompleteString);
	}

	cvar_map cvars;
	CHECK(register_dfa_cvars(cvars));
	CHECK(cvars.size() == 4);
	CHECK(!register_dfa_cvars(cvars));

	// defaults
	{
		auto opts = load_dfa_options(cvars);
		CHECK(opts.validate_on_construction);
		CHECK(opts.table_lookup == table_lookup_policy::strict);
		CHECK(opts.closure_max_iterations == default_closure_max_iterations);
		CHECK(opts.rename_initial_id == 1);
	}

	// reading a configuration file
	cmds commands;
	{
		const std::string filename = temp_filename("dfakit_test_config.cfg");
		const std::string content =
			"// dfakit test configuration\n"
			"set dfa_validate_on_construction false;\n"
			"set dfa_table_lookup \"fallback\"; /* legacy lookup */\n"
			"set dfa_closure_max_iterations\n"
			"    /* value on the next line */ 128;\n"
			"set dfa_rename_initial_id 0;\n";
		CHECK(write_file(filename, content) == filesystem_status::Success);
		CHECK(load_config_file(cvars, commands, filename) == cmd_status::Success);

		auto opts = load_dfa_options(cvars);
		CHECK(!opts.validate_on_construction);
		CHECK(opts.table_lookup == table_lookup_policy::last_triple_fallback);
		CHECK(opts.closure_max_iterations == 128);
		CHECK(opts.rename_initial_id == 0);

		std::filesystem::remove(filename);
	}

	// errors while reading configuration
	{
		CHECK(load_config_file(cvars, commands, temp_filename("dfakit_does_not_exist.cfg"))
				== cmd_status::ErrorFileNotFound);
		CHECK(commands.execute_string("frobnicate 1;") == cmd_status::ErrorCommandNotFound);

		// conversion failures keep the previous value
		CHECK(commands.execute_string("set dfa_closure_max_iterations many;") == cmd_status::Success);
		CHECK(cvars.get("dfa_closure_max_iterations")->as_unsigned() == 128);
		CHECK(commands.execute_string("set dfa_closure_max_iterations -1;") == cmd_status::Success);
		CHECK(load_dfa_options(cvars).closure_max_iterations == 128);
		CHECK(parse("many", cvars.get("dfa_closure_max_iterations")) == cvar_status::conversion_failure);
		CHECK(parse("1", nullptr) == cvar_status::is_nullptr);

		// invalid lookup policies fall back to strict
		CHECK(commands.execute_string("set dfa_table_lookup \"sloppy\";") == cmd_status::Success);
		CHECK(load_dfa_options(cvars).table_lookup == table_lookup_policy::strict);
		CHECK(commands.execute_string("set dfa_table_lookup fallback;") == cmd_status::Success);
	}

	// serialized cvars can be read back
	{
		const std::string serialized = cvars.to_string();
		cvars.reset_all();
		CHECK(load_dfa_options(cvars).closure_max_iterations == default_closure_max_iterations);

		CHECK(commands.execute_string(serialized) == cmd_status::Success);
		auto opts = load_dfa_options(cvars);
		CHECK(!opts.validate_on_construction);
		CHECK(opts.table_lookup == table_lookup_policy::last_triple_fallback);
		CHECK(opts.closure_max_iterations == 128);
		CHECK(opts.rename_initial_id == 0);
	}

	// strings with quotes survive serialization
	{
		cvar_map strings;
		cmds setter;
		CHECK(strings.register_cvar("greeting", "say \"hi\"") != nullptr);
		CHECK(strings.get("greeting")->type() == cvar_type::CVT_STRING);
		CHECK(register_set_cmd(setter, strings) == cmd_status::Success);
		CHECK(register_set_cmd(setter, strings) == cmd_status::ErrorDuplicateCommand);

		const std::string serialized = strings.to_string();
		CHECK(parse("plain", strings.get("greeting")) == cvar_status::success);
		CHECK(setter.execute_string(serialized) == cmd_status::Success);
		CHECK(strings.get("greeting")->as_string() == "say \"hi\"");

		// doubles are written with all significant digits
		CHECK(strings.register_cvar("ratio", 1.0 / 3.0) != nullptr);
		const std::string with_ratio = strings.to_string();
		CHECK(parse("0.5", strings.get("ratio")) == cvar_status::success);
		CHECK(setter.execute_string(with_ratio) == cmd_status::Success);
		CHECK(strings.get("ratio")->as_double() == 1.0 / 3.0);

		// reading a cvar with the wrong type yields a default value
		CHECK(strings.get("greeting")->as_unsigned() == 0);
	}

	// options take effect
	{
		auto opts = load_dfa_options(cvars);

		// the start state is unknown, but validation is off
		auto unchecked = make_dfa<int, char>({'a'}, {0}, 1, {},
				[](const int &, const char &) { return 0; }, opts);
		CHECK(unchecked.start == 1);

		std::vector<transition_triple<int, char>> partial = {{0, 'a', 1}, {1, 'a', 0}};
		auto legacy = from_table(std::vector<char>{'a', 'b'}, std::vector<int>{0, 1}, 0,
				std::vector<int>{0}, partial, opts.table_lookup);
		CHECK(legacy.next(0, 'b') == 0);

		auto renamed = beautify(legacy, opts);
		CHECK(renamed.start == 0);

		// the closure bound applies to automata without enumerated states
		auto counter = make_dfa<int, char>({'+'}, {}, 0, {200},
				[](const int &s, const char &) { return std::min(s + 1, 200); }, opts);
		CHECK(reachable_states(counter).size() == 201);
		CHECK_THROWS(reachable_states(counter, opts), closure_limit_exceeded);
		CHECK_THROWS(tabulate_reachable(counter, opts), closure_limit_exceeded);
		CHECK_THROWS(beautify(counter, opts), closure_limit_exceeded);

		opts.closure_max_iterations = 200;
		CHECK(reachable_states(counter, opts).size() == 201);
		CHECK(beautify(counter, opts).states.size() == 201);
	}

	return TEST_RESULT();
}
