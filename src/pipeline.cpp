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

#include "abag/pipeline.hpp"
#include "abag/error.hpp"
#include "abag/parser.hpp"
#include "abag/processor.hpp"
#include "abag/utilities.hpp"

#include <iostream>

namespace fs = std::filesystem;

namespace abag
{

// --------------------------------------------------------------------

summary_report run_batch(const config &cfg, archive_client &client, const std::vector<reference_entry> &entries)
{
	batch_orchestrator orchestrator(cfg, client);
	return orchestrator.run(entries);
}

summary_report run_batch(const std::vector<reference_entry> &entries, const fs::path &output_dir,
	uint32_t parallelism, bool incremental, std::optional<size_t> limit)
{
	config cfg(output_dir);
	cfg.parallelism = parallelism;
	cfg.incremental = incremental;
	cfg.limit = limit;

	curl_archive_client client(cfg.timeout);
	return run_batch(cfg, client, entries);
}

// --------------------------------------------------------------------

outcome_record process_one(const config &cfg, archive_client &client, std::string_view id,
	const std::vector<std::string> &antigen_chains, const std::vector<std::string> &antibody_chains)
{
	auto pdb_id = normalize_identifier(id);
	auto assignment = chain_assignment::create(antigen_chains, antibody_chains);

	cfg.ensure_directories();

	auto layout = cfg.get_layout();
	auto ledger = failure_ledger::load(layout.ledger_file);

	entry_processor processor(cfg, client);
	auto result = processor.process(pdb_id, assignment);

	if (ledger.update(result))
	{
		std::error_code ec;
		ledger.save(layout.ledger_file, ec);
		if (ec and VERBOSE >= 0)
			std::cerr << "Could not save failure ledger " << layout.ledger_file << ": " << ec.message() << '\n';
	}

	return result;
}

outcome_record process_one(std::string_view id, const std::vector<std::string> &antigen_chains,
	const std::vector<std::string> &antibody_chains, const fs::path &output_dir, bool force)
{
	config cfg(output_dir);
	cfg.force = force;

	curl_archive_client client(cfg.timeout);
	return process_one(cfg, client, id, antigen_chains, antibody_chains);
}

// --------------------------------------------------------------------

summary_report retry_failed(const config &cfg, archive_client &client)
{
	batch_orchestrator orchestrator(cfg, client);
	return orchestrator.retry();
}

summary_report retry_failed(const fs::path &output_dir, std::optional<size_t> limit)
{
	config cfg(output_dir);
	cfg.limit = limit;

	curl_archive_client client(cfg.timeout);
	return retry_failed(cfg, client);
}

// --------------------------------------------------------------------

std::vector<chain_summary> inspect_chains(const config &cfg, archive_client &client, std::string_view id, std::error_code &ec)
{
	std::vector<chain_summary> result;

	auto pdb_id = normalize_identifier(id, ec);
	if (ec)
		return result;

	source_fetcher fetcher(cfg, client);
	auto fetched = fetcher.fetch(pdb_id, cfg.output_dir, true, ec);
	if (ec)
		return result;

	auto raw = load(fetched.path, ec);
	if (ec)
		return result;

	auto s = parse(pdb_id, raw, cfg.parse, ec);
	if (not ec)
		result = summarize_chains(s);

	return result;
}

std::vector<chain_summary> inspect_chains(std::string_view id, const fs::path &output_dir, std::error_code &ec)
{
	config cfg(output_dir);

	curl_archive_client client(cfg.timeout);
	return inspect_chains(cfg, client, id, ec);
}

} // namespace abag
