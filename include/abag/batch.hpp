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

#include "abag/config.hpp"
#include "abag/fetcher.hpp"
#include "abag/ledger.hpp"
#include "abag/splitter.hpp"

#include <atomic>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

/**
 * @file batch.hpp
 *
 * Processing of many entries with a pool of worker threads.
 */

namespace abag
{

// --------------------------------------------------------------------

/// \brief One entry to process: an identifier and its chain assignment
struct reference_entry
{
	std::string id;
	chain_assignment assignment;

	/**
	 * @brief Create an entry from the fields of a SAbDab summary row.
	 *
	 * @param pdb     The entry identifier
	 * @param heavy   The heavy chain, may be empty or NA
	 * @param light   The light chain, may be empty or NA
	 * @param antigen The antigen chain(s), separated by | or ,
	 * @param ec      Set to errc::invalid_identifier or errc::invalid_chain_assignment on failure
	 */
	static reference_entry from_row(std::string_view pdb, std::string_view heavy, std::string_view light,
		std::string_view antigen, std::error_code &ec);
};

// --------------------------------------------------------------------

/**
 * @brief Runs a batch of entries through the entry_processor using a fixed
 * number of worker threads.
 *
 * Outcomes are collected by a single thread which updates the failure
 * ledger, storing it after each change, and the summary report. At the
 * end of a run the report is stored as processing_summary.json.
 */
class batch_orchestrator
{
  public:
	batch_orchestrator(const config &cfg, archive_client &client);

	batch_orchestrator(const batch_orchestrator &) = delete;
	batch_orchestrator &operator=(const batch_orchestrator &) = delete;

	/**
	 * @brief Process @a entries. Duplicate identifiers are skipped, only
	 * the first config::limit entries are used.
	 *
	 * In incremental mode entries that are listed in the failure ledger
	 * with the same chain assignment are not processed again, their
	 * recorded outcome is counted instead.
	 *
	 * Throws std::runtime_error if the output directory cannot be used.
	 */
	summary_report run(const std::vector<reference_entry> &entries);

	/**
	 * @brief Process the entries in the failure ledger again, in order of
	 * identifier and limited to config::limit entries.
	 */
	summary_report retry();

	/// \brief Stop handing out new entries, entries being processed are finished
	void stop() { m_stop = true; }

	/// \brief The failure ledger as it was at the end of the last run
	const failure_ledger &get_ledger() const { return m_ledger; }

  private:
	summary_report run(const std::vector<reference_entry> &entries, bool skip_ledger_entries);

	config m_config;
	archive_client &m_client;
	failure_ledger m_ledger;
	std::atomic<bool> m_stop = false;
};

} // namespace abag
