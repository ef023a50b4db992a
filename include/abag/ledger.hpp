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

#include "abag/outcome.hpp"
#include "abag/splitter.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <system_error>

/**
 * @file ledger.hpp
 *
 * The persistent record of failed entries and the summary of a run.
 */

namespace abag
{

// --------------------------------------------------------------------

/// \brief What is remembered about the last failed attempt for an entry
struct ledger_entry
{
	abag::status status = abag::status::download_failed;
	std::error_code reason;
	std::string detail;
	std::string timestamp;         ///< ISO 8601 time at which the attempt finished
	chain_assignment assignment;   ///< The assignment used, so the entry can be retried

	static ledger_entry from_outcome(const outcome_record &outcome);
};

/**
 * @brief The failure ledger, stored as failed_entries.json in the output
 * directory.
 *
 * An entry is added or replaced for each failed outcome and removed again
 * when a later attempt for the same identifier succeeds. Entries are kept
 * sorted by identifier.
 *
 * The ledger is not thread safe, in a batch it is only touched by the
 * aggregating thread.
 */
class failure_ledger
{
  public:
	using map_type = std::map<std::string, ledger_entry>;

	failure_ledger() = default;

	/**
	 * @brief Load the ledger stored in @a file. A missing file results in
	 * an empty ledger, a file that cannot be read or parsed throws a
	 * std::runtime_error.
	 */
	static failure_ledger load(const std::filesystem::path &file);

	/// \brief Store the ledger in @a file, sets @a ec to errc::io_failure on failure
	void save(const std::filesystem::path &file, std::error_code &ec) const;

	/// \brief Record @a outcome, returns true if the ledger changed
	bool update(const outcome_record &outcome);

	bool contains(const std::string &id) const { return m_entries.count(id) > 0; }

	/// \brief Return the entry for @a id, or an empty optional if there is none
	std::optional<ledger_entry> get(const std::string &id) const;

	const map_type &entries() const { return m_entries; }

	size_t size() const { return m_entries.size(); }
	bool empty() const { return m_entries.empty(); }

  private:
	map_type m_entries;
};

// --------------------------------------------------------------------

/**
 * @brief Counts of the outcomes of one run. The counts only depend on the
 * set of outcomes added, not on the order in which they were added.
 *
 * Next to the outcome counts the report tells how much work was done:
 * the number of raw files downloaded, the number of entries whose output
 * was already present and the number of entries skipped because they
 * are in the failure ledger. The start and end time of the run are
 * recorded as well.
 */
class summary_report
{
  public:
	using clock_type = std::chrono::system_clock;

	void add(abag::status st, std::error_code reason);

	void add(const outcome_record &outcome);

	/// \brief Count an entry that was not processed since it failed before
	void add_skipped(const ledger_entry &previous);

	void set_run_time(clock_type::time_point start, clock_type::time_point end)
	{
		m_start = start;
		m_end = end;
	}

	size_t get_total() const { return m_total; }
	size_t get_success() const { return m_success; }
	size_t get_failed() const { return m_total - m_success; }

	size_t get_downloaded() const { return m_downloaded; }
	size_t get_skipped_existing() const { return m_skipped_existing; }
	size_t get_skipped_failed() const { return m_skipped_failed; }

	clock_type::time_point get_start_time() const { return m_start; }
	clock_type::time_point get_end_time() const { return m_end; }

	/// \brief The number of outcomes with status @a st
	size_t get_count(abag::status st) const;

	/// \brief Failure counts keyed by the reason_name of the error
	const std::map<std::string, size_t> &get_failure_breakdown() const { return m_failure_breakdown; }

	/// \brief Store the report as JSON in @a file, sets @a ec to errc::io_failure on failure
	void save(const std::filesystem::path &file, std::error_code &ec) const;

	/// \brief The report as formatted JSON text
	std::string str() const;

	/// \brief Compares the outcome counts, the work counters and times are not compared
	bool operator==(const summary_report &rhs) const
	{
		return m_total == rhs.m_total and m_success == rhs.m_success and
		       m_by_status == rhs.m_by_status and m_failure_breakdown == rhs.m_failure_breakdown;
	}

	bool operator!=(const summary_report &rhs) const
	{
		return not operator==(rhs);
	}

  private:
	size_t m_total = 0, m_success = 0;
	size_t m_downloaded = 0, m_skipped_existing = 0, m_skipped_failed = 0;
	std::map<abag::status, size_t> m_by_status;
	std::map<std::string, size_t> m_failure_breakdown;
	clock_type::time_point m_start, m_end;
};

} // namespace abag
