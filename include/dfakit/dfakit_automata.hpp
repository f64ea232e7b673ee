/*
 * dfakit_automata - all of dfakit's automaton algorithms
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details.
 *
 * Note that dfakit_log.hpp requires one translation unit of the program to
 * contain DFAKIT_LOG_DECLARATION.
 */
#pragma once

#include <dfakit/dfakit_fixpoint.hpp>
#include <dfakit/dfakit_dfa.hpp>
#include <dfakit/dfakit_reachability.hpp>
#include <dfakit/dfakit_table.hpp>
#include <dfakit/dfakit_canonical.hpp>
#include <dfakit/dfakit_analysis.hpp>
#include <dfakit/dfakit_export.hpp>
