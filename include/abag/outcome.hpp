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

#include "abag/model.hpp"
#include "abag/splitter.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

/**
 * @file outcome.hpp
 *
 * The result of processing one entry.
 */

namespace abag
{

// --------------------------------------------------------------------

/// \brief The terminal state of processing an entry
enum class status
{
	success,
	download_failed,
	parse_failed,
	chain_not_found,
	write_failed
};

/// \brief The name used for @a s in the JSON files, e.g. "download_failed"
std::string_view to_string(status s);

/// \brief Return the status named @a name, or an empty optional if there is no such status
std::optional<status> status_from_string(std::string_view name);

// --------------------------------------------------------------------

/**
 * @brief The outcome of processing a single entry.
 *
 * Created once by the entry_processor when processing has reached its
 * terminal state and not changed afterwards.
 */
struct outcome_record
{
	using clock_type = std::chrono::system_clock;

	std::string id;
	abag::status status = abag::status::success;
	std::error_code reason;           ///< empty on success
	std::string detail;               ///< human readable explanation
	chain_assignment assignment;
	std::optional<structure_format> format; ///< format of the raw file, if one was read
	size_t antigen_residues = 0;
	size_t antibody_residues = 0;
	bool downloaded = false;          ///< the raw file was downloaded in this attempt
	bool up_to_date = false;          ///< both output files existed, no stage was run
	clock_type::time_point started, finished;

	bool succeeded() const { return status == abag::status::success; }
};

/// \brief Format @a t as an ISO 8601 UTC time stamp, e.g. "2024-05-01T12:00:00Z"
std::string format_timestamp(std::chrono::system_clock::time_point t);

} // namespace abag
