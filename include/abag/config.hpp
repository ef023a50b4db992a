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
#include "abag/parser.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @file config.hpp
 *
 * The configuration of a processing run and the layout of the output
 * directory derived from it.
 */

namespace abag
{

/// \brief The archive used when neither the configuration nor the environment specify one
const char kDefaultArchiveURL[] = "https://files.rcsb.org/download/";

// --------------------------------------------------------------------

/**
 * @brief All paths used for one output directory.
 *
 * @code
 * <output_dir>/raw/<ID>.<ext>
 * <output_dir>/processed/antigens/<ID>_antigen.pdb
 * <output_dir>/processed/antibodies/<ID>_antibody.pdb
 * <output_dir>/failed_entries.json
 * <output_dir>/processing_summary.json
 * @endcode
 */
struct output_layout
{
	explicit output_layout(const std::filesystem::path &output_dir);

	std::filesystem::path root;
	std::filesystem::path raw_dir;
	std::filesystem::path antigen_dir;
	std::filesystem::path antibody_dir;
	std::filesystem::path ledger_file;
	std::filesystem::path summary_file;

	/// \brief Where the raw file for @a id in format @a format is stored
	std::filesystem::path get_raw_path(const std::string &id, structure_format format) const;

	std::filesystem::path get_antigen_path(const std::string &id) const;
	std::filesystem::path get_antibody_path(const std::string &id) const;
};

// --------------------------------------------------------------------

/**
 * @brief The settings for a run. Default constructed values are the
 * defaults, except for archive_url which can be overridden with the
 * environment variable ABAG_ARCHIVE_URL.
 */
struct config
{
	config();

	explicit config(std::filesystem::path dir)
		: config()
	{
		output_dir = std::move(dir);
	}

	std::filesystem::path output_dir = ".";

	std::string archive_url = kDefaultArchiveURL;             ///< base URL, the file name is appended
	std::chrono::seconds timeout{ 60 };                        ///< per request timeout
	uint32_t download_attempts = 3;                            ///< attempts per format for transient failures
	std::chrono::milliseconds retry_delay{ 2000 };             ///< delay between attempts
	uint32_t parallelism = 1;                                  ///< worker count, 0 means one per hardware thread
	bool incremental = true;                                   ///< reuse raw files and outputs that exist
	bool force = false;                                        ///< redo entries even if their outputs exist
	std::optional<size_t> limit;                               ///< process at most this many entries
	parse_options parse;

	output_layout get_layout() const { return output_layout(output_dir); }

	/// \brief The number of worker threads to use, at least one
	uint32_t get_worker_count() const;

	/**
	 * @brief Create the output directories. Throws a std::runtime_error
	 * if they cannot be created or the output directory is not writable.
	 */
	void ensure_directories() const;
};

} // namespace abag
