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

#include "abag/batch.hpp"
#include "abag/error.hpp"
#include "abag/processor.hpp"
#include "abag/queue.hpp"
#include "abag/utilities.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <thread>

namespace abag
{

// --------------------------------------------------------------------

reference_entry reference_entry::from_row(std::string_view pdb, std::string_view heavy, std::string_view light,
	std::string_view antigen, std::error_code &ec)
{
	reference_entry result;

	result.id = normalize_identifier(pdb, ec);
	if (not ec)
		result.assignment = chain_assignment::create(parse_chain_ids(antigen), parse_chain_id(heavy), parse_chain_id(light), ec);

	return result;
}

// --------------------------------------------------------------------

batch_orchestrator::batch_orchestrator(const config &cfg, archive_client &client)
	: m_config(cfg)
	, m_client(client)
{
}

summary_report batch_orchestrator::run(const std::vector<reference_entry> &entries)
{
	return run(entries, m_config.incremental and not m_config.force);
}

summary_report batch_orchestrator::retry()
{
	m_ledger = failure_ledger::load(m_config.get_layout().ledger_file);

	std::vector<reference_entry> entries;
	for (auto &[id, entry] : m_ledger.entries())
	{
		if (m_config.limit and entries.size() >= *m_config.limit)
			break;
		entries.push_back({ id, entry.assignment });
	}

	if (VERBOSE > 0)
		std::cerr << "Retrying " << entries.size() << " of " << m_ledger.size() << " failed entries\n";

	return run(entries, false);
}

summary_report batch_orchestrator::run(const std::vector<reference_entry> &entries, bool skip_ledger_entries)
{
	m_config.ensure_directories();

	auto layout = m_config.get_layout();

	m_ledger = failure_ledger::load(layout.ledger_file);
	m_stop = false;

	summary_report report;
	auto start = summary_report::clock_type::now();

	// Select the entries to process: drop duplicates, apply the limit and
	// count the entries that failed before instead of processing them again

	std::vector<reference_entry> todo;
	std::set<std::string> seen;

	for (auto &entry : entries)
	{
		if (m_config.limit and seen.size() >= *m_config.limit)
			break;

		std::error_code ec;
		auto id = normalize_identifier(entry.id, ec);
		if (ec)
		{
			// cannot be fetched, nor stored in the ledger
			if (VERBOSE > 0)
				std::cerr << "Invalid identifier '" << entry.id << "'\n";

			seen.insert("'" + entry.id + "'");
			report.add(status::download_failed, ec);
			continue;
		}

		if (not seen.insert(id).second)
		{
			if (VERBOSE > 0)
				std::cerr << "Skipping duplicate entry " << id << '\n';
			continue;
		}

		if (skip_ledger_entries)
		{
			// a failed entry is processed again when it now comes with a different assignment
			if (auto failed = m_ledger.get(id); failed and failed->assignment == entry.assignment)
			{
				if (VERBOSE > 1)
					std::cerr << "Skipping " << id << ", it failed before with " << to_string(failed->status) << '\n';

				report.add_skipped(*failed);
				continue;
			}
		}

		todo.push_back({ id, entry.assignment });
	}

	if (todo.empty())
	{
		if (VERBOSE > 0)
			std::cerr << "Nothing to do\n";
	}
	else
	{
		entry_processor processor(m_config, m_client);

		blocking_queue<reference_entry> q1;
		blocking_queue<outcome_record> q2;

		progress_bar progress(todo.size(), "processing");

		// The aggregating thread, the only one to touch the ledger and the report
		std::thread tc([this, &q2, &report, &progress, &layout]()
			{
				for (;;)
				{
					auto outcome = q2.pop();
					if (outcome.id.empty()) // sentinel
						break;

					if (m_ledger.update(outcome))
					{
						std::error_code ec;
						m_ledger.save(layout.ledger_file, ec);
						if (ec and VERBOSE >= 0)
							std::cerr << "Could not save failure ledger " << layout.ledger_file << ": " << ec.message() << '\n';
					}

					report.add(outcome);

					progress.message(outcome.id);
					progress.consumed(1);
				} });

		std::vector<std::thread> t;
		size_t nr_of_threads = std::min<size_t>(m_config.get_worker_count(), todo.size());

		for (size_t i = 0; i < nr_of_threads; ++i)
		{
			t.emplace_back([this, &q1, &q2, &processor]()
				{
					for (;;)
					{
						auto entry = q1.pop();

						if (entry.id.empty()) // sentinel
						{
							q1.push({});
							break;
						}

						if (m_stop)
							continue;

						outcome_record outcome;

						try
						{
							outcome = processor.process(entry.id, entry.assignment);
						}
						catch (const std::exception &ex)
						{
							if (VERBOSE >= 0)
								std::cerr << "Unexpected error processing " << entry.id << ": " << ex.what() << '\n';

							outcome.id = entry.id;
							outcome.assignment = entry.assignment;
							outcome.status = status::write_failed;
							outcome.reason = make_error_code(errc::io_failure);
							outcome.detail = ex.what();
							outcome.started = outcome.finished = outcome_record::clock_type::now();
						}

						q2.push(outcome);
					} });
		}

		for (auto &entry : todo)
		{
			if (m_stop)
			{
				if (VERBOSE > 0)
					std::cerr << "Stopping, not all entries were processed\n";
				break;
			}

			q1.push(entry);
		}

		// signal end
		q1.push({});

		for (auto &ti : t)
			ti.join();

		q2.push({});

		tc.join();
	}

	report.set_run_time(start, summary_report::clock_type::now());

	std::error_code ec;
	report.save(layout.summary_file, ec);
	if (ec and VERBOSE >= 0)
		std::cerr << "Could not write " << layout.summary_file << ": " << ec.message() << '\n';

	if (VERBOSE > 0)
		std::cerr << "Processed " << report.get_total() << " entries, " << report.get_success() << " succeeded, "
				  << report.get_failed() << " failed\n";

	return report;
}

} // namespace abag
