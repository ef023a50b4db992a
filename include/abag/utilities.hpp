/*-
 * SPDX-License-Identifier: BSD-2-Clause
 *
 * Copyright (c) 2024 NKI/AVL, Netherlands Cancer Institute
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this
 *    list of conditions and the following disclaimer
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE FOR
 * ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#pragma once

#include "abag/exports.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#ifndef STDOUT_FILENO
/// @brief For systems that lack this value
#define STDOUT_FILENO 1
#endif

/** \file utilities.hpp
 *
 * Generic bits and pieces: the global verbosity level, a progress_bar
 * for batch runs and helpers to write files atomically.
 */

namespace abag
{

/**
 * @brief The global variable VERBOSE contains the level of verbosity
 * requested. A value of 0 is normal, with some output on error conditions.
 * A value > 0 will result in more output, the higher the value, the more
 * output. A value < 0 will make the library silent, even in error
 * conditions.
 */
extern ABAG_EXPORT int VERBOSE;

/// return the version string of this library
std::string get_version_nr();

/// return the width of the current output terminal, or 80 if it cannot be determined
uint32_t get_terminal_width();

// --------------------------------------------------------------------

/**
 * @brief A simple progress bar for lengthy operations. The bar is only
 * shown when stdout is a terminal and VERBOSE is not negative. It is
 * updated from a separate thread, so consumed() may be called from any
 * thread.
 */
class progress_bar
{
  public:
	/**
	 * @brief Construct a new progress bar object
	 *
	 * @param inMax The maximum value, corresponding to 100%
	 * @param inAction The text to show in front of the bar
	 */
	progress_bar(int64_t inMax, const std::string &inAction);

	/// @brief Destructor, prints a summary line if the bar was shown
	~progress_bar();

	progress_bar(const progress_bar &) = delete;
	progress_bar &operator=(const progress_bar &) = delete;

	/// @brief Advance the bar by @a inConsumed steps
	void consumed(int64_t inConsumed);

	/// @brief Replace the message shown in front of the bar
	void message(const std::string &inMessage);

  private:
	struct progress_bar_impl *m_impl;
};

// --------------------------------------------------------------------

/**
 * @brief Return a path next to @a dest that can be used to write the
 * contents of @a dest before moving it into place with commit_file.
 *
 * The name is unique per process and thread, starts with a dot and
 * ends in '.part' so it is never mistaken for a complete file.
 */
std::filesystem::path temporary_path_for(const std::filesystem::path &dest);

/**
 * @brief Move the file @a tmp to @a dest, replacing @a dest if it exists.
 * On failure @a tmp is removed and @a ec is set.
 */
void commit_file(const std::filesystem::path &tmp, const std::filesystem::path &dest, std::error_code &ec);

/**
 * @brief Write @a data to @a dest with the temp-then-move discipline.
 * Sets @a ec to errc::io_failure on any failure, @a dest is then untouched.
 */
void write_file_atomically(const std::filesystem::path &dest, std::string_view data, std::error_code &ec);

} // namespace abag
