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

#include "abag/processor.hpp"
#include "abag/error.hpp"
#include "abag/parser.hpp"
#include "abag/text.hpp"
#include "abag/utilities.hpp"
#include "abag/writer.hpp"

#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace abag
{

namespace
{

std::string write_failure_detail(const structure &s, const fs::path &file)
{
	for (auto &c : s.chains())
	{
		if (c.get_id().length() > 1)
			return "chain ID " + c.get_id() + " does not fit in a PDB file";
	}

	return "could not write " + file.string();
}

} // namespace

// --------------------------------------------------------------------

entry_processor::entry_processor(const config &cfg, archive_client &client)
	: m_config(cfg)
	, m_layout(cfg.output_dir)
	, m_fetcher(cfg, client)
{
}

outcome_record entry_processor::process(const std::string &id, const chain_assignment &assignment, bool force) const
{
	outcome_record result;
	result.started = outcome_record::clock_type::now();
	result.assignment = assignment;

	auto finish = [&result](abag::status st, std::error_code ec, std::string detail)
	{
		result.status = st;
		result.reason = ec;
		result.detail = std::move(detail);
		result.finished = outcome_record::clock_type::now();

		if (VERBOSE > 0 and st != status::success)
			std::cerr << result.id << ": " << to_string(st) << " (" << result.detail << ")\n";
		else if (VERBOSE > 1)
			std::cerr << result.id << ": " << to_string(st) << '\n';

		return result;
	};

	std::error_code ec;

	result.id = normalize_identifier(id, ec);
	if (ec)
	{
		result.id = id;
		return finish(status::download_failed, ec, "'" + id + "' is not a valid identifier");
	}

	if (assignment.empty())
		return finish(status::chain_not_found, make_error_code(errc::invalid_chain_assignment), "no chains assigned");

	auto antigen_path = m_layout.get_antigen_path(result.id);
	auto antibody_path = m_layout.get_antibody_path(result.id);

	bool incremental = m_config.incremental and not force;

	if (incremental and fs::exists(antigen_path, ec) and fs::exists(antibody_path, ec))
	{
		result.up_to_date = true;
		return finish(status::success, {}, "up to date");
	}
	ec.clear();

	// Fetching

	auto fetched = m_fetcher.fetch(result.id, m_config.output_dir, incremental, ec);
	if (ec)
		return finish(status::download_failed, ec, fetched.detail);

	result.format = fetched.format;
	result.downloaded = fetched.downloaded;

	// Parsing

	auto raw = load(fetched.path, ec);
	if (ec)
		return finish(status::parse_failed, ec, "could not read " + fetched.path.string());

	auto s = parse(result.id, raw, m_config.parse, ec);
	if (ec)
		return finish(status::parse_failed, ec, ec.message() + " in " + fetched.path.filename().string());

	// Splitting

	auto parts = split(s, assignment, ec);
	if (ec)
		return finish(status::chain_not_found, ec, "missing chain(s) " + join(parts.missing, ","));

	result.antigen_residues = parts.antigen.get_residue_count();
	result.antibody_residues = parts.antibody.get_residue_count();

	// Writing

	for (auto &dir : { m_layout.antigen_dir, m_layout.antibody_dir })
	{
		fs::create_directories(dir, ec);
		if (ec)
			return finish(status::write_failed, make_error_code(errc::io_failure), "cannot create " + dir.string() + ": " + ec.message());
	}

	// Both sides are rendered before either file is created, an entry that
	// cannot be written completely leaves no output behind

	std::ostringstream antigen_text, antibody_text;

	write(antigen_text, parts.antigen, ec);
	if (ec)
		return finish(status::write_failed, ec, write_failure_detail(parts.antigen, antigen_path));

	write(antibody_text, parts.antibody, ec);
	if (ec)
		return finish(status::write_failed, ec, write_failure_detail(parts.antibody, antibody_path));

	write_file_atomically(antigen_path, antigen_text.str(), ec);
	if (ec)
		return finish(status::write_failed, ec, "could not write " + antigen_path.string());

	write_file_atomically(antibody_path, antibody_text.str(), ec);
	if (ec)
	{
		std::error_code rm_ec;
		fs::remove(antigen_path, rm_ec);
		if (rm_ec and VERBOSE >= 0)
			std::cerr << "Could not remove " << antigen_path << ": " << rm_ec.message() << '\n';

		return finish(status::write_failed, ec, "could not write " + antibody_path.string());
	}

	return finish(status::success, {}, {});
}

} // namespace abag
