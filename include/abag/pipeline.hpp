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

#include "abag/batch.hpp"
#include "abag/config.hpp"
#include "abag/fetcher.hpp"
#include "abag/ledger.hpp"
#include "abag/model.hpp"
#include "abag/outcome.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

/**
 * @file pipeline.hpp
 *
 * The operations offered to a command line front end. Each has a version
 * taking a complete config and an archive_client, and a convenience
 * version using the default configuration and libcurl.
 */

namespace abag
{

// --------------------------------------------------------------------

/**
 * @brief Process all @a entries, see batch_orchestrator::run.
 *
 * Throws std::runtime_error when the output directory cannot be used.
 */
summary_report run_batch(const config &cfg, archive_client &client, const std::vector<reference_entry> &entries);

summary_report run_batch(const std::vector<reference_entry> &entries, const std::filesystem::path &output_dir,
	uint32_t parallelism = 1, bool incremental = true, std::optional<size_t> limit = {});

// --------------------------------------------------------------------

/**
 * @brief Process a single entry with an explicit chain assignment.
 *
 * The failure ledger in the output directory is updated with the result.
 * An invalid identifier or chain assignment is reported by throwing a
 * std::system_error before anything else is done.
 */
outcome_record process_one(const config &cfg, archive_client &client, std::string_view id,
	const std::vector<std::string> &antigen_chains, const std::vector<std::string> &antibody_chains);

outcome_record process_one(std::string_view id, const std::vector<std::string> &antigen_chains,
	const std::vector<std::string> &antibody_chains, const std::filesystem::path &output_dir, bool force = false);

// --------------------------------------------------------------------

/// \brief Process the entries in the failure ledger again, see batch_orchestrator::retry
summary_report retry_failed(const config &cfg, archive_client &client);

summary_report retry_failed(const std::filesystem::path &output_dir, std::optional<size_t> limit = {});

// --------------------------------------------------------------------

/**
 * @brief Fetch and parse entry @a id and list its chains with their
 * residue counts, in the order in which they appear in the file.
 *
 * Sets @a ec to the error of the fetch or parse stage on failure.
 */
std::vector<chain_summary> inspect_chains(const config &cfg, archive_client &client, std::string_view id, std::error_code &ec);

std::vector<chain_summary> inspect_chains(std::string_view id, const std::filesystem::path &output_dir, std::error_code &ec);

} // namespace abag
