/*
 * dfakit_log - a minimalistic logging interface
 *
 * SPDX-FileCopyrightText: 2022 Nicolai Waniek <rochus@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * This file declares an extern variable. Hence, it is necessary to have
 *     DFAKIT_LOG_DECLARATION;
 * in one of the translation files of your project! The logger forwards each
 * message to a policy, which decides where the message goes. A program that
 * uses dfakit thus looks like
 *
 *     #include <dfakit/dfakit_log.hpp>
 *     #include <dfakit/dfakit_automata.hpp>
 *
 *     namespace dfakit {
 *         DFAKIT_LOG_DECLARATION(new logger_policy_stdcout());
 *     }
 *
 *     int main() {
 *         // build and analyze automata
 *         return 0;
 *     }
 *
 * The logger assumes ownership of the policy, unless false is passed as second
 * argument during DFAKIT_LOG_DECLARATION. In that case, set_policy returns the
 * pointer to the old policy and the caller has to tidy up.
 *
 * Log levels are selected at compile time. Define one of
 *     DFAKIT_ENABLE_LOG_LEVEL_VERBOSE
 *     DFAKIT_ENABLE_LOG_LEVEL_DEBUG
 *     DFAKIT_ENABLE_LOG_LEVEL_WARNING
 *     DFAKIT_ENABLE_LOG_LEVEL_ERROR
 * before including any dfakit header. Without any of them, all log_* calls
 * compile to nothing.
 */
#pragma once

#ifndef DFAKIT_LOG
#define DFAKIT_LOG
#endif

#include <fstream>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace dfakit {

#define DFAKIT_LOG_LEVEL_NONE    0
#define DFAKIT_LOG_LEVEL_ERROR   1
#define DFAKIT_LOG_LEVEL_WARNING 2
#define DFAKIT_LOG_LEVEL_DEBUG   3
#define DFAKIT_LOG_LEVEL_VERBOSE 4


#ifdef DFAKIT_ENABLE_LOG_LEVEL_VERBOSE
	#define DFAKIT_LOG_LEVEL DFAKIT_LOG_LEVEL_VERBOSE
#else
	#ifdef DFAKIT_ENABLE_LOG_LEVEL_DEBUG
		#define DFAKIT_LOG_LEVEL DFAKIT_LOG_LEVEL_DEBUG
	#else
		#ifdef DFAKIT_ENABLE_LOG_LEVEL_WARNING
			#define DFAKIT_LOG_LEVEL DFAKIT_LOG_LEVEL_WARNING
		#else
			#ifdef DFAKIT_ENABLE_LOG_LEVEL_ERROR
				#define DFAKIT_LOG_LEVEL DFAKIT_LOG_LEVEL_ERROR
			#else
				#define DFAKIT_LOG_LEVEL DFAKIT_LOG_LEVEL_NONE
			#endif
		#endif
	#endif
#endif


//  function  enum     macro    prefix
#define DFAKIT_LOG_LEVEL_LIST(_)          \
	_(error,   Error,   ERROR,   "EE: ")  \
	_(warning, Warning, WARNING, "WW: ")  \
	_(debug,   Debug,   DEBUG,   "II: ")  \
	_(verbose, Verbose, VERBOSE, ">>: ")


#define DFAKIT_LOG_LEVEL_ENUM_ITEM(_0, ENUM_NAME, MACRO_NAME, ...) \
	ENUM_NAME = DFAKIT_LOG_LEVEL_##MACRO_NAME,

enum struct log_level : unsigned {
	None = DFAKIT_LOG_LEVEL_NONE,
	DFAKIT_LOG_LEVEL_LIST(DFAKIT_LOG_LEVEL_ENUM_ITEM)
};

#undef DFAKIT_LOG_LEVEL_ENUM_ITEM


/*
 * log_prefix - the tag that precedes messages of a level
 */
inline const char*
log_prefix(log_level level)
{
	#define DFAKIT_LOG_LEVEL_PREFIX(_0, ENUM_NAME, _2, PREFIX) \
		case log_level::ENUM_NAME: return PREFIX;

	switch (level) {
		DFAKIT_LOG_LEVEL_LIST(DFAKIT_LOG_LEVEL_PREFIX)
		case log_level::None: break;
	}
	#undef DFAKIT_LOG_LEVEL_PREFIX
	return "";
}


// can use these macros instead of explicitly naming the thing
#define DFAKIT_LOG_INSTANCE    dfakit_logger_instance
#define DFAKIT_LOG_DECLARATION logger DFAKIT_LOG_INSTANCE


/*
 * logger_policy - destination of log messages
 *
 * write is called with complete messages, one per call to one of the log_*
 * functions. Calls are serialized by the logger.
 */
struct logger_policy {
	virtual void write(log_level level, const std::string &msg) = 0;
	virtual void init() {}
	virtual void finalize() {}
	virtual ~logger_policy() = default;
};


/*
 * logger_policy_ostream - policy to write everything to a given stream
 *
 * The stream is not owned by the policy and must outlive it.
 */
struct logger_policy_ostream : logger_policy {

	logger_policy_ostream(std::ostream &stream)
		: _stream(stream)
	{}

	~logger_policy_ostream() override { this->finalize(); }

	void write(log_level level, const std::string &msg) override {
		this->_stream << log_prefix(level) << msg;
	}

	void finalize() override { this->_stream.flush(); }

private:
	std::ostream &_stream;
};


/*
 * logger_policy_stdcout - policy to write everything to std::cout
 */
struct logger_policy_stdcout : logger_policy_ostream {
	logger_policy_stdcout()
		: logger_policy_ostream(std::cout)
	{}
};


/*
 * logger_policy_file_t - policy to write everything to a file
 *
 * The file is truncated when the policy is initialized, and closed when it is
 * finalized. Messages are dropped if the file cannot be opened.
 */
struct logger_policy_file_t : logger_policy {

	logger_policy_file_t(const std::string &filename)
		: _filename(filename)
	{}

	~logger_policy_file_t() override { this->finalize(); }

	void write(log_level level, const std::string &msg) override {
		if (this->_stream.is_open())
			this->_stream << log_prefix(level) << msg;
	}

	void init() override {
		if (!this->_stream.is_open())
			this->_stream.open(this->_filename, std::ios::trunc);
	}

	void finalize() override {
		if (this->_stream.is_open())
			this->_stream.close();
	}

private:
	std::string   _filename;
	std::ofstream _stream;
};


/*
 * logger - A minimalistic logger implementation
 */
struct logger {

	/*
	 * logger - Create a new logger
	 *
	 * In case ownership is assumed, then the policy will be destroyed either
	 * in the logger's destructor, or when a new policy is set via set_policy.
	 */
	logger(logger_policy *policy = nullptr, bool has_policy_ownership = true)
		: _has_policy_ownership(has_policy_ownership)
	{
		this->set_policy(policy);
	}

	logger(const logger &) = delete;

	~logger() {
		if (!this->_policy)
			return;

		this->_policy->finalize();
		if (this->_has_policy_ownership)
			delete this->_policy;
	}


	/*
	 * log - format all arguments into one message and pass it to the policy
	 */
	template <log_level Level, typename... Args>
	void
	log(Args &&... args)
	{
		std::ostringstream os;
		(os << ... << std::forward<Args>(args));

		std::lock_guard<std::mutex> guard(this->_mtx);
		if (this->_policy)
			this->_policy->write(Level, os.str());
	}


	/*
	 * set_policy - set a new logger policy.
	 *
	 * The old policy is finalized. If the logger owns it, it is destroyed and
	 * nullptr is returned. Otherwise the old policy is returned to the caller.
	 * The new policy is initialized.
	 */
	logger_policy*
	set_policy(logger_policy* policy) {
		std::lock_guard<std::mutex> guard(this->_mtx);
		logger_policy *old_policy = this->_policy;

		if (old_policy)
			old_policy->finalize();

		if (this->_has_policy_ownership) {
			delete old_policy;
			old_policy = nullptr;
		}

		this->_policy = policy;
		if (this->_policy)
			this->_policy->init();

		return old_policy;
	}

private:
	logger_policy *
		_policy = nullptr;

	bool
		_has_policy_ownership = true;

	std::mutex
		_mtx;
};


extern DFAKIT_LOG_DECLARATION;


/*
 * log_error, log_warning, log_debug, log_verbose - log on the global logger
 *
 * Calls below the compile time log level vanish entirely.
 */
#define DFAKIT_LOG_FUNCTION_IMPL(FN_NAME, ENUM_NAME, MACRO_NAME, ...)                 \
	template <typename... Args>                                                      \
	inline void                                                                      \
	log_##FN_NAME(Args &&... args)                                                   \
	{                                                                                \
		if constexpr (DFAKIT_LOG_LEVEL >= DFAKIT_LOG_LEVEL_##MACRO_NAME)             \
			DFAKIT_LOG_INSTANCE.log<log_level::ENUM_NAME>(std::forward<Args>(args)...); \
	}

DFAKIT_LOG_LEVEL_LIST(DFAKIT_LOG_FUNCTION_IMPL)
#undef DFAKIT_LOG_FUNCTION_IMPL


} // dfakit::
