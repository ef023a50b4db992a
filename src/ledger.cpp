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

#include "abag/ledger.hpp"
#include "abag/error.hpp"
#include "abag/utilities.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace fs = std::filesystem;

namespace abag
{

// --------------------------------------------------------------------

ledger_entry ledger_entry::from_outcome(const outcome_record &outcome)
{
	return { outcome.status, outcome.reason, outcome.detail, format_timestamp(outcome.finished), outcome.assignment };
}

void to_json(json &j, const ledger_entry &e)
{
	j = json{
		{ "status", to_string(e.status) },
		{ "reason", reason_name(e.reason) },
		{ "detail", e.detail },
		{ "timestamp", e.timestamp },
		{ "antigen_chains", e.assignment.get_antigen_chains() },
		{ "heavy_chain", nullptr },
		{ "light_chain", nullptr }
	};

	if (e.assignment.get_heavy_chain())
		j["heavy_chain"] = *e.assignment.get_heavy_chain();
	if (e.assignment.get_light_chain())
		j["light_chain"] = *e.assignment.get_light_chain();
}

void from_json(const json &j, ledger_entry &e)
{
	auto st = status_from_string(j.at("status").get<std::string>());
	if (not st or *st == status::success)
		throw std::runtime_error("invalid status " + j.at("status").dump());

	e.status = *st;
	e.reason = reason_from_name(j.value("reason", ""));
	e.detail = j.value("detail", "");
	e.timestamp = j.value("timestamp", "");

	std::vector<std::string> antigen = j.value("antigen_chains", std::vector<std::string>{});
	std::optional<std::string> heavy, light;

	if (j.contains("heavy_chain") and j["heavy_chain"].is_string())
		heavy = j["heavy_chain"].get<std::string>();
	if (j.contains("light_chain") and j["light_chain"].is_string())
		light = j["light_chain"].get<std::string>();

	// an entry without a usable assignment is kept, a retry reports the problem
	std::error_code ec;
	e.assignment = chain_assignment::create(std::move(antigen), std::move(heavy), std::move(light), ec);
}

// --------------------------------------------------------------------

failure_ledger failure_ledger::load(const fs::path &file)
{
	failure_ledger result;

	std::error_code ec;
	if (not fs::exists(file, ec))
		return result;

	std::ifstream in(file);
	if (not in.is_open())
		throw std::runtime_error("Could not open failure ledger " + file.string());

	try
	{
		json data = json::parse(in);

		if (not data.is_object())
			throw std::runtime_error("not a JSON object");

		for (auto &[id, value] : data.items())
		{
			try
			{
				result.m_entries.emplace(id, value.get<ledger_entry>());
			}
			catch (const std::exception &ex)
			{
				if (VERBOSE >= 0)
					std::cerr << "Ignoring invalid ledger entry for " << id << ": " << ex.what() << '\n';
			}
		}
	}
	catch (const json::exception &ex)
	{
		throw std::runtime_error("Error reading failure ledger " + file.string() + ": " + ex.what());
	}

	if (VERBOSE > 1)
		std::cerr << "Loaded " << result.size() << " entries from " << file << '\n';

	return result;
}

void failure_ledger::save(const fs::path &file, std::error_code &ec) const
{
	json data = json::object();
	for (auto &[id, entry] : m_entries)
		data[id] = entry;

	// details and chain ids may hold bytes that are not valid UTF-8
	write_file_atomically(file, data.dump(2, ' ', false, json::error_handler_t::replace) + '\n', ec);
}

bool failure_ledger::update(const outcome_record &outcome)
{
	if (outcome.succeeded())
		return m_entries.erase(outcome.id) > 0;

	m_entries[outcome.id] = ledger_entry::from_outcome(outcome);
	return true;
}

std::optional<ledger_entry> failure_ledger::get(const std::string &id) const
{
	std::optional<ledger_entry> result;

	auto i = m_entries.find(id);
	if (i != m_entries.end())
		result = i->second;

	return result;
}

// --------------------------------------------------------------------

void summary_report::add(abag::status st, std::error_code reason)
{
	++m_total;
	++m_by_status[st];

	if (st == status::success)
		++m_success;
	else
		++m_failure_breakdown[reason ? reason_name(reason) : std::string{ to_string(st) }];
}

void summary_report::add(const outcome_record &outcome)
{
	add(outcome.status, outcome.reason);

	if (outcome.downloaded)
		++m_downloaded;
	if (outcome.up_to_date)
		++m_skipped_existing;
}

void summary_report::add_skipped(const ledger_entry &previous)
{
	add(previous.status, previous.reason);
	++m_skipped_failed;
}

size_t summary_report::get_count(abag::status st) const
{
	auto i = m_by_status.find(st);
	return i == m_by_status.end() ? 0 : i->second;
}

std::string summary_report::str() const
{
	json by_status = json::object();
	for (auto st : { status::success, status::download_failed, status::parse_failed, status::chain_not_found, status::write_failed })
		by_status[std::string{ to_string(st) }] = get_count(st);

	json data{
		{ "total", m_total },
		{ "success", m_success },
		{ "failed", get_failed() },
		{ "by_status", by_status },
		{ "failure_breakdown", m_failure_breakdown },
		{ "downloaded", m_downloaded },
		{ "skipped_existing", m_skipped_existing },
		{ "skipped_failed", m_skipped_failed }
	};

	if (m_start != clock_type::time_point{})
	{
		data["start_time"] = format_timestamp(m_start);
		data["end_time"] = format_timestamp(m_end);
		data["duration_seconds"] = std::chrono::duration<double>(m_end - m_start).count();
	}

	return data.dump(2, ' ', false, json::error_handler_t::replace) + '\n';
}

void summary_report::save(const fs::path &file, std::error_code &ec) const
{
	write_file_atomically(file, str(), ec);
}

} // namespace abag
