/*
 * dfakit_cmd - commands, and reading them from text
 *
 * SPDX-FileCopyrightText: 2022 Nicolai Waniek <rochus@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * Commands are written as
 *
 *     name arg0 arg1 "quoted arg";
 *
 * where ; terminates a command. // line comments and C-style block comments
 * are ignored. Inside quoted arguments, \" stands for a quote and \\ for a
 * backslash.
 * The configuration of dfakit (see dfakit_config.hpp) is a list of such
 * commands, mostly "set".
 */
#pragma once

#include <algorithm>
#include <cstring>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <dfakit/dfakit_filesystem.hpp>
#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_utils.hpp>

namespace dfakit {


using cmd_function_t = std::function<void (std::vector<std::string> argv)>;


/*
 * cmd_token - a command name together with its arguments
 */
struct cmd_token {
	std::string name;
	std::vector<std::string> argv;
};


enum struct cmd_status : unsigned {
	Success,
	ErrorCommandNotFound,
	ErrorFileNotFound,
	ErrorTokenizerIncompleteString,
	ErrorDuplicateCommand,
};

inline
bool
test(cmd_status s)
{
	return to_underlying(s) != 0;
}


/*
 * cmd_looking_at - test if str continues with pattern at offset
 */
inline bool
cmd_looking_at(const std::string &str, size_t offset, const char *pattern)
{
	return str.compare(offset, std::strlen(pattern), pattern) == 0;
}


inline bool
cmd_is_whitespace(char c)
{
	return static_cast<unsigned char>(c) <= ' ';
}


/*
 * cmd_skip_string - offset just past the quoted string that starts at offset
 *
 * Escaped characters are skipped as a whole. Returns str.length() + 1 if the
 * string is not terminated.
 */
inline size_t
cmd_skip_string(const std::string &str, size_t offset)
{
	const size_t slen = str.length();
	size_t i = offset + 1;
	while (i < slen) {
		if (str[i] == '\\')
			i += 2;
		else if (str[i] == '\"')
			return i + 1;
		else
			++i;
	}
	return slen + 1;
}


/*
 * cmd_unescape - replace \" and \\ by the characters they stand for
 */
inline std::string
cmd_unescape(const std::string &str)
{
	std::string result;
	result.reserve(str.length());
	for (size_t i = 0; i < str.length(); ++i) {
		if (str[i] == '\\' && i + 1 < str.length() && (str[i+1] == '\"' || str[i+1] == '\\'))
			++i;
		result.push_back(str[i]);
	}
	return result;
}


/*
 * cmd_escape - inverse of cmd_unescape
 */
inline std::string
cmd_escape(const std::string &str)
{
	std::string result;
	result.reserve(str.length());
	for (char c: str) {
		if (c == '\"' || c == '\\')
			result.push_back('\\');
		result.push_back(c);
	}
	return result;
}


/*
 * cmd_compress - strip comments and collapse whitespace (in-place)
 *
 * Every run of whitespace and comments turns into a single blank, which is
 * dropped at the beginning of the string and after a ;. Quoted strings are
 * kept verbatim.
 */
inline void
cmd_compress(std::string &str)
{
	const size_t slen = str.length();
	std::string out;
	out.reserve(slen);
	bool blank = false;

	size_t i = 0;
	while (i < slen) {
		if (cmd_is_whitespace(str[i])) {
			blank = true;
			++i;
		}
		else if (cmd_looking_at(str, i, "//")) {
			blank = true;
			i = str.find('\n', i);
			if (i == std::string::npos)
				i = slen;
		}
		else if (cmd_looking_at(str, i, "/*")) {
			blank = true;
			i = str.find("*/", i + 2);
			i = (i == std::string::npos) ? slen : i + 2;
		}
		else {
			if (blank && !out.empty() && out.back() != ';')
				out.push_back(' ');
			blank = false;

			if (str[i] == '\"') {
				size_t end = std::min(cmd_skip_string(str, i), slen);
				out.append(str, i, end - i);
				i = end;
			}
			else
				out.push_back(str[i++]);
		}
	}

	str = std::move(out);
}


/*
 * cmd_tokenize - turn a compressed string into command tokens
 *
 * The first word after a ; is the name of a command, all further words up to
 * the next ; are its arguments. For instance
 *
 *    set some_variable 123.4 "hello world";
 *
 * yields the command name `set` with argv consisting of `some_variable`,
 * `123.4` and `hello world`. Surrounding quotes are stripped and escapes are
 * resolved.
 *
 * The string is expected to be free of comments, see cmd_compress.
 */
inline cmd_status
cmd_tokenize(const std::string &str, std::vector<cmd_token> &cmd_toks)
{
	const size_t slen = str.length();
	bool expect_name = true;

	size_t i = 0;
	while (i < slen) {
		if (str[i] == ';') {
			expect_name = true;
			++i;
			continue;
		}
		if (cmd_is_whitespace(str[i])) {
			++i;
			continue;
		}

		std::string word;
		if (str[i] == '\"') {
			size_t end = cmd_skip_string(str, i);
			if (end > slen) {
				log_error("Malformed input found while tokenizing, string did not end.\n");
				return cmd_status::ErrorTokenizerIncompleteString;
			}
			word = cmd_unescape(str.substr(i + 1, end - i - 2));
			i = end;
		}
		else {
			size_t end = i;
			while (end < slen && str[end] != ';' && !cmd_is_whitespace(str[end]))
				++end;
			word = str.substr(i, end - i);
			i = end;
		}

		if (expect_name) {
			cmd_toks.push_back({std::move(word), {}});
			expect_name = false;
		}
		else
			cmd_toks.back().argv.push_back(std::move(word));
	}

	return cmd_status::Success;
}


/*
 * cmds - commands of a program, by name
 */
struct cmds
{
	/*
	 * find - the function of a command, or nullptr if it is unknown
	 */
	const cmd_function_t*
	find(const std::string &name) const
	{
		auto it = this->_commands.find(name);
		return it != this->_commands.end() ? &it->second : nullptr;
	}

	cmd_status
	register_cmd(const std::string &name, cmd_function_t function)
	{
		if (!this->_commands.emplace(name, std::move(function)).second) {
			log_error("Duplicate command \"", name, "\".\n");
			return cmd_status::ErrorDuplicateCommand;
		}
		return cmd_status::Success;
	}

	/*
	 * execute_string - compress, tokenize and run all commands of a string
	 *
	 * Nothing is executed if the string cannot be tokenized. Otherwise,
	 * execution stops at the first unknown command.
	 */
	cmd_status
	execute_string(std::string str)
	{
		cmd_compress(str);

		std::vector<cmd_token> cmd_toks;
		auto status = cmd_tokenize(str, cmd_toks);
		if (status != cmd_status::Success)
			return status;

		for (auto &tok: cmd_toks) {
			auto *fn = this->find(tok.name);
			if (!fn) {
				log_error("Unknown command \"", tok.name, "\".\n");
				return cmd_status::ErrorCommandNotFound;
			}
			(*fn)(tok.argv);
		}
		return cmd_status::Success;
	}

	cmd_status
	execute_file(const std::string &filename)
	{
		std::string content;
		if (test(read_file(filename, content))) {
			log_error("Could not read command file \"", filename, "\".\n");
			return cmd_status::ErrorFileNotFound;
		}
		return this->execute_string(std::move(content));
	}

private:
	std::map<std::string, cmd_function_t>
		_commands;
};


} // dfakit::
