/*
 * dfakit_filesystem - reading and writing whole files
 *
 * SPDX-FileCopyrightText: 2022 Nicolai Waniek <rochus@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * Configuration files are small, so they are read and written in one go.
 */
#pragma once

#include <fstream>
#include <sstream>
#include <string>

#include <dfakit/dfakit_utils.hpp>

namespace dfakit {


enum struct filesystem_status : unsigned {
	Success,
	ErrorFileNotFound,
	ErrorWriteFailed,
};

inline
bool
test(filesystem_status s)
{
	return to_underlying(s) != 0;
}


/*
 * read_file - read the content of a file into a string
 *
 * content is left empty if the file cannot be opened.
 */
inline filesystem_status
read_file(const std::string &filename, std::string &content)
{
	content.clear();

	std::ifstream file(filename);
	if (!file)
		return filesystem_status::ErrorFileNotFound;

	std::ostringstream os;
	os << file.rdbuf();
	content = os.str();
	return filesystem_status::Success;
}


/*
 * write_file - replace the content of a file, creating it if necessary
 */
inline filesystem_status
write_file(const std::string &filename, const std::string &content)
{
	std::ofstream file(filename, std::ios::trunc);
	if (!(file << content))
		return filesystem_status::ErrorWriteFailed;
	return filesystem_status::Success;
}


} // dfakit::
