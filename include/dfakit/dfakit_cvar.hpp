/*
 * dfakit_cvar - configuration variables, in the spirit of Quake's cvars
 *
 * SPDX-FileCopyrightText: 2022 Nicolai Waniek <rochus@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * A cvar is a named, typed value with a default. Cvars live in a cvar_map, are
 * registered by the code that reads them, and are changed by the "set" command
 * of a configuration file (see dfakit_cmd.hpp and dfakit_config.hpp).
 *
 * The value of a cvar is stored in a std::variant whose alternatives appear in
 * the same order as the entries of DFAKIT_CVAR_TYPE_LIST, so that the index of
 * the variant is the cvar_type of the cvar.
 */
#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <dfakit/dfakit_cmd.hpp>
#include <dfakit/dfakit_log.hpp>
#include <dfakit/dfakit_utils.hpp>

namespace dfakit {


//   enum           type          accessor
#define DFAKIT_CVAR_TYPE_LIST(_)          \
	_(CVT_BOOL,     bool,         boolean)  \
	_(CVT_INT,      int,          integer)  \
	_(CVT_UNSIGNED, unsigned,     unsigned) \
	_(CVT_DOUBLE,   double,       double)   \
	_(CVT_STRING,   std::string,  string)


#define DFAKIT_CVAR_ENUM_ITEM(ENUM_NAME, ...) ENUM_NAME,
enum class cvar_type : unsigned {
	DFAKIT_CVAR_TYPE_LIST(DFAKIT_CVAR_ENUM_ITEM)
};
#undef DFAKIT_CVAR_ENUM_ITEM


using cvar_value = std::variant<bool, int, unsigned, double, std::string>;

#define DFAKIT_CVAR_CHECK_ALTERNATIVE(ENUM_NAME, CPP_TYPE, ...)                      \
	static_assert(std::is_same_v<                                                   \
		std::variant_alternative_t<to_underlying(cvar_type::ENUM_NAME), cvar_value>, \
		CPP_TYPE>);
DFAKIT_CVAR_TYPE_LIST(DFAKIT_CVAR_CHECK_ALTERNATIVE)
#undef DFAKIT_CVAR_CHECK_ALTERNATIVE


inline const char*
cvar_type_name(cvar_type type)
{
	#define DFAKIT_CVAR_TYPE_NAME(ENUM_NAME, _1, ACCESSOR) \
		case cvar_type::ENUM_NAME: return #ACCESSOR;

	switch (type) {
		DFAKIT_CVAR_TYPE_LIST(DFAKIT_CVAR_TYPE_NAME)
	}
	#undef DFAKIT_CVAR_TYPE_NAME
	return "unknown";
}


/*
 * cvar_storage_t - the type in which a default value of type T is kept
 *
 * Everything that converts to std::string, string literals in particular, is
 * stored as std::string.
 */
template <typename T>
using cvar_storage_t = std::conditional_t<
	std::is_convertible_v<T, std::string>,
	std::string,
	std::decay_t<T>>;


/*
 * status codes returned by cvar functions
 */
enum struct cvar_status : unsigned {
	success            = 0,
	is_nullptr         = 1,
	conversion_failure = 2,
};


/*
 * cvar - a configuration variable
 *
 * The type of a cvar is fixed by its default value. Parsing a string into a
 * cvar never changes its type.
 */
struct cvar
{
	const std::string
		name;

	const cvar_value
		default_value;

	cvar_value
		value;

	cvar(std::string _name, cvar_value _default)
		: name(std::move(_name))
		, default_value(_default)
		, value(std::move(_default))
	{}

	// each cvar is unique
	cvar(const cvar &) = delete;

	cvar_type
	type() const
	{
		return static_cast<cvar_type>(this->value.index());
	}

	/*
	 * get - the value of the cvar as T
	 *
	 * Reading a cvar as another type than it was registered with is logged
	 * and yields a value-initialized T.
	 */
	template <typename T>
	T
	get() const
	{
		if (auto *v = std::get_if<T>(&this->value))
			return *v;

		log_warning("Accessing cvar \"", this->name, "\", which is of type ",
				cvar_type_name(this->type()), ", with a mismatching type.\n");
		return T{};
	}

	#define DFAKIT_CVAR_AS_FN(_0, CPP_TYPE, ACCESSOR) \
		CPP_TYPE as_##ACCESSOR() const { return this->get<CPP_TYPE>(); }
	DFAKIT_CVAR_TYPE_LIST(DFAKIT_CVAR_AS_FN)
	#undef DFAKIT_CVAR_AS_FN
};


/*
 * parse - parse a string into a given cvar
 *
 * In case the conversion from std::string to the cvar's type fails, the value
 * of the cvar will be left as is.
 */
inline cvar_status
parse(const std::string &str, cvar *cvar)
{
	if (!cvar)
		return cvar_status::is_nullptr;

	return std::visit([&](auto &current) {
		using T = std::decay_t<decltype(current)>;
		auto tmp = str_to_type<T>(str);
		if (!tmp) {
			log_error("Conversion from string \"", str, "\" to ",
					cvar_type_name(cvar->type()), " failed for cvar \"",
					cvar->name, "\".\n");
			return cvar_status::conversion_failure;
		}
		log_verbose("Setting cvar \"", cvar->name, "\" to ", str, ".\n");
		current = std::move(*tmp);
		return cvar_status::success;
	}, cvar->value);
}


/*
 * cvar_to_str - convert the value of a cvar to a string representation
 */
inline std::string
cvar_to_str(const cvar *cvar)
{
	return std::visit([&](const auto &current) -> std::string {
		using T = std::decay_t<decltype(current)>;
		auto tmp = type_to_str<T>(current);
		if (!tmp) {
			log_error("Conversion of cvar \"", cvar->name, "\" to string failed.\n");
			return "";
		}
		return *tmp;
	}, cvar->value);
}


/*
 * cvar_map - registry of all cvars of a program
 *
 * The map owns its cvars. Pointers returned by get and register_cvar stay
 * valid for the lifetime of the map. Cvars are kept in registration order.
 */
struct cvar_map
{
	cvar_map() = default;
	cvar_map(const cvar_map &) = delete;

	cvar *
	get(const std::string &name) const
	{
		auto it = std::find_if(this->_cvars.begin(), this->_cvars.end(),
				[&name](const auto &c) { return c->name == name; });
		return it != this->_cvars.end() ? it->get() : nullptr;
	}

	/*
	 * register_cvar - register a cvar, given its default value
	 *
	 * Returns nullptr if a cvar with the same name already exists.
	 */
	template <typename T>
	cvar*
	register_cvar(const std::string &name, T default_value)
	{
		if (this->get(name)) {
			log_error("Duplicate cvar name \"", name, "\".\n");
			return nullptr;
		}

		cvar_value v = cvar_storage_t<T>(default_value);
		this->_cvars.push_back(std::make_unique<cvar>(name, std::move(v)));
		return this->_cvars.back().get();
	}

	void
	reset_all()
	{
		for (auto &c: this->_cvars)
			c->value = c->default_value;
	}

	/*
	 * to_string - serialize all cvars as "set" commands
	 *
	 * The output can be read back with dfakit::cmds::execute_string, given that
	 * a "set" command is registered (see dfakit_config.hpp).
	 */
	std::string
	to_string() const
	{
		std::ostringstream os;
		for (auto &c: this->_cvars) {
			os << "set " << c->name << " ";
			if (c->type() == cvar_type::CVT_STRING)
				os << "\"" << cmd_escape(cvar_to_str(c.get())) << "\"";
			else
				os << cvar_to_str(c.get());
			os << ";\n";
		}
		return os.str();
	}

	size_t
	size() const
	{
		return this->_cvars.size();
	}

private:
	std::vector<std::unique_ptr<cvar>>
		_cvars;
};


#undef DFAKIT_CVAR_TYPE_LIST

} // dfakit::
