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

#include "test-main.hpp"
#include "test-support.hpp"

#include <abag.hpp>

#include <cstdio>
#include <fstream>
#include <set>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

using json = nlohmann::json;

// --------------------------------------------------------------------

namespace
{

abag::reference_entry entry(const std::string &id, const std::string &heavy, const std::string &light, const std::string &antigen)
{
	std::error_code ec;
	auto result = abag::reference_entry::from_row(id, heavy, light, antigen, ec);
	if (ec)
		throw std::system_error(ec, id);
	return result;
}

json read_json(const fs::path &file)
{
	std::ifstream in(file);
	return json::parse(in);
}

// Four good entries and two that fail in different ways
void fill_archive(fake_archive &archive)
{
	for (auto id : { "1AAA", "1AAB", "1AAC", "1AAD" })
		archive.add(std::string{ id } + ".pdb", make_pdb(id, { { "A", 30 }, { "H", 12 }, { "L", 11 } }));

	archive.add("2BBB.pdb", make_pdb("2BBB", { { "A", 30 }, { "H", 12 } }));
}

std::vector<abag::reference_entry> reference_entries()
{
	return {
		entry("1aaa", "H", "L", "A"),
		entry("1AAB", "H", "L", "A"),
		entry("1AAC", "H", "NA", "A"),
		entry("1AAD", "H", "L", "A | A"),
		entry("2BBB", "H", "L", "A"),   // no light chain in the file
		entry("3CCC", "H", "L", "A"),   // not in the archive
	};
}

} // namespace

// --------------------------------------------------------------------

TEST_CASE("reference_entry_1")
{
	std::error_code ec;

	auto e = abag::reference_entry::from_row(" 6oej ", "h", "l", "A | B", ec);
	REQUIRE_FALSE(ec);
	CHECK(e.id == "6OEJ");
	CHECK(e.assignment.get_antigen_chains() == std::vector<std::string>{ "A", "B" });
	CHECK(e.assignment.get_heavy_chain() == "H");
	CHECK(e.assignment.get_light_chain() == "L");

	e = abag::reference_entry::from_row("7NAN", "B", "NA", "A", ec);
	REQUIRE_FALSE(ec);
	CHECK_FALSE(e.assignment.get_light_chain());

	abag::reference_entry::from_row("7NAN", "NA", "NA", "A", ec);
	CHECK(ec == abag::errc::invalid_chain_assignment);

	ec.clear();
	abag::reference_entry::from_row("7NA", "H", "L", "A", ec);
	CHECK(ec == abag::errc::invalid_identifier);

	// a Latin-1 encoded field
	ec.clear();
	abag::reference_entry::from_row("7NAN", "H\xe9", "L", "A", ec);
	CHECK(ec == abag::errc::invalid_chain_assignment);

	ec.clear();
	abag::reference_entry::from_row("7NAN", "H", "L", "A|\xc1", ec);
	CHECK(ec == abag::errc::invalid_chain_assignment);
}

// --------------------------------------------------------------------

TEST_CASE("batch_1")
{
	auto dir = scratch_dir("batch-1");
	auto cfg = test_config(dir);

	fake_archive archive;
	fill_archive(archive);

	auto report = abag::run_batch(cfg, archive, reference_entries());

	CHECK(report.get_total() == 6);
	CHECK(report.get_success() == 4);
	CHECK(report.get_failed() == 2);
	CHECK(report.get_count(abag::status::chain_not_found) == 1);
	CHECK(report.get_count(abag::status::download_failed) == 1);
	CHECK(report.get_failure_breakdown() == std::map<std::string, size_t>{ { "chain_not_found", 1 }, { "unavailable", 1 } });

	abag::output_layout layout(dir);

	for (auto id : { "1AAA", "1AAB", "1AAC", "1AAD" })
	{
		CHECK(fs::exists(layout.get_antigen_path(id)));
		CHECK(fs::exists(layout.get_antibody_path(id)));
	}

	CHECK_FALSE(fs::exists(layout.get_antigen_path("2BBB")));

	// the failure ledger
	auto ledger = read_json(layout.ledger_file);
	REQUIRE(ledger.is_object());
	CHECK(ledger.size() == 2);

	CHECK(ledger["2BBB"]["status"] == "chain_not_found");
	CHECK(ledger["2BBB"]["reason"] == "chain_not_found");
	CHECK(ledger["2BBB"]["antigen_chains"] == json::array({ "A" }));
	CHECK(ledger["2BBB"]["heavy_chain"] == "H");
	CHECK(ledger["2BBB"]["light_chain"] == "L");
	CHECK(ledger["2BBB"]["timestamp"].get<std::string>().back() == 'Z');

	CHECK(ledger["3CCC"]["status"] == "download_failed");
	CHECK(ledger["3CCC"]["reason"] == "unavailable");

	// the summary
	auto summary = read_json(layout.summary_file);
	CHECK(summary["total"] == 6);
	CHECK(summary["success"] == 4);
	CHECK(summary["failed"] == 2);
	CHECK(summary["by_status"]["success"] == 4);
	CHECK(summary["by_status"]["parse_failed"] == 0);
	CHECK(summary["failure_breakdown"]["unavailable"] == 1);

	// the work done: 3CCC could not be downloaded
	CHECK(report.get_downloaded() == 5);
	CHECK(report.get_skipped_existing() == 0);
	CHECK(report.get_skipped_failed() == 0);
	CHECK(summary["downloaded"] == 5);
	CHECK(summary["skipped_existing"] == 0);
	CHECK(summary["skipped_failed"] == 0);

	CHECK(summary["start_time"].get<std::string>().back() == 'Z');
	CHECK(summary["end_time"].get<std::string>().back() == 'Z');
	CHECK(summary["duration_seconds"].get<double>() >= 0);
	CHECK(report.get_start_time() <= report.get_end_time());
}

TEST_CASE("batch_incremental_1")
{
	// a second run over the same output directory does not touch the archive
	// and reports the same counts

	auto dir = scratch_dir("batch-incremental-1");
	auto cfg = test_config(dir);

	fake_archive archive;
	fill_archive(archive);

	auto first = abag::run_batch(cfg, archive, reference_entries());
	auto calls = archive.get_call_count();

	abag::output_layout layout(dir);
	auto modified = fs::last_write_time(layout.get_antigen_path("1AAA"));

	auto second = abag::run_batch(cfg, archive, reference_entries());

	CHECK(archive.get_call_count() == calls);
	CHECK(first == second);
	CHECK(fs::last_write_time(layout.get_antigen_path("1AAA")) == modified);

	// but the report shows nothing was done
	CHECK(first.get_downloaded() == 5);
	CHECK(second.get_downloaded() == 0);
	CHECK(second.get_skipped_existing() == 4);
	CHECK(second.get_skipped_failed() == 2);

	auto summary = read_json(layout.summary_file);
	CHECK(summary["downloaded"] == 0);
	CHECK(summary["skipped_existing"] == 4);
	CHECK(summary["skipped_failed"] == 2);
}

TEST_CASE("batch_parallel_1")
{
	auto entries = reference_entries();

	fake_archive archive;
	fill_archive(archive);

	auto dir1 = scratch_dir("batch-parallel-1a");
	auto cfg1 = test_config(dir1);
	auto sequential = abag::run_batch(cfg1, archive, entries);

	auto dir2 = scratch_dir("batch-parallel-1b");
	auto cfg2 = test_config(dir2);
	cfg2.parallelism = 4;
	auto parallel = abag::run_batch(cfg2, archive, entries);

	CHECK(sequential == parallel);
	CHECK(sequential.get_downloaded() == parallel.get_downloaded());

	CHECK(read_json(abag::output_layout(dir1).ledger_file).size() == read_json(abag::output_layout(dir2).ledger_file).size());
}

TEST_CASE("batch_duplicates_1")
{
	auto dir = scratch_dir("batch-duplicates-1");
	auto cfg = test_config(dir);

	fake_archive archive;
	fill_archive(archive);

	auto report = abag::run_batch(cfg, archive, {
		entry("1AAA", "H", "L", "A"),
		entry("1aaa", "H", "L", "A"),
		entry("1AAB", "H", "L", "A"),
		entry("1AAA", "H", "NA", "A"),
	});

	CHECK(report.get_total() == 2);
	CHECK(report.get_success() == 2);
	CHECK(archive.get_call_count() == 2);
}

TEST_CASE("batch_limit_1")
{
	auto dir = scratch_dir("batch-limit-1");
	auto cfg = test_config(dir);
	cfg.limit = 3;

	fake_archive archive;
	fill_archive(archive);

	auto report = abag::run_batch(cfg, archive, reference_entries());

	CHECK(report.get_total() == 3);
	CHECK(report.get_success() == 3);

	abag::output_layout layout(dir);
	CHECK(fs::exists(layout.get_antigen_path("1AAC")));
	CHECK_FALSE(fs::exists(layout.get_antigen_path("1AAD")));
}

TEST_CASE("batch_invalid_id_1")
{
	auto dir = scratch_dir("batch-invalid-id-1");
	auto cfg = test_config(dir);

	fake_archive archive;
	fill_archive(archive);

	abag::reference_entry bad{ "ABCDE", abag::chain_assignment::create({ "A" }, { "H" }) };

	auto report = abag::run_batch(cfg, archive, { bad, entry("1AAA", "H", "L", "A") });

	CHECK(report.get_total() == 2);
	CHECK(report.get_success() == 1);
	CHECK(report.get_count(abag::status::download_failed) == 1);
	CHECK(report.get_failure_breakdown().at("invalid_identifier") == 1);
}

TEST_CASE("batch_empty_1")
{
	auto dir = scratch_dir("batch-empty-1");
	auto cfg = test_config(dir);

	fake_archive archive;

	auto report = abag::run_batch(cfg, archive, {});
	CHECK(report.get_total() == 0);

	abag::output_layout layout(dir);
	CHECK(fs::exists(layout.summary_file));
	CHECK(fs::is_directory(layout.raw_dir));
	CHECK(fs::is_directory(layout.antigen_dir));
	CHECK(fs::is_directory(layout.antibody_dir));
}

TEST_CASE("batch_changed_assignment_1")
{
	// an entry in the ledger is processed again when its assignment changed

	auto dir = scratch_dir("batch-changed-assignment-1");
	auto cfg = test_config(dir);

	fake_archive archive;
	fill_archive(archive);

	auto report = abag::run_batch(cfg, archive, { entry("2BBB", "H", "L", "A") });
	REQUIRE(report.get_count(abag::status::chain_not_found) == 1);

	abag::output_layout layout(dir);
	REQUIRE(abag::failure_ledger::load(layout.ledger_file).contains("2BBB"));

	// same assignment, skipped
	report = abag::run_batch(cfg, archive, { entry("2BBB", "H", "L", "A") });
	CHECK(report.get_skipped_failed() == 1);
	CHECK(report.get_count(abag::status::chain_not_found) == 1);

	// corrected assignment, processed
	report = abag::run_batch(cfg, archive, { entry("2BBB", "H", "NA", "A") });
	CHECK(report.get_skipped_failed() == 0);
	CHECK(report.get_success() == 1);

	CHECK(abag::failure_ledger::load(layout.ledger_file).empty());
	CHECK(fs::exists(layout.get_antibody_path("2BBB")));
}

TEST_CASE("batch_stop_1")
{
	// stopping during a run finishes the entries being processed and
	// does not start new ones

	auto dir = scratch_dir("batch-stop-1");
	auto cfg = test_config(dir);
	cfg.parallelism = 2;

	std::vector<abag::reference_entry> entries;
	for (int i = 0; i < 20; ++i)
	{
		char id[5];
		snprintf(id, sizeof(id), "5S%02d", i);
		entries.push_back(entry(id, "H", "L", "A"));
	}

	fake_archive archive;
	abag::batch_orchestrator orchestrator(cfg, archive);

	archive.on_request([&orchestrator](const std::string &)
		{ orchestrator.stop(); });

	auto report = orchestrator.run(entries);

	CHECK(report.get_total() >= 1);
	CHECK(report.get_total() <= cfg.parallelism);
	CHECK(report.get_count(abag::status::download_failed) == report.get_total());

	// every entry that reached the archive was finished and recorded
	std::set<std::string> requested;
	for (auto &url : archive.get_requests())
	{
		auto name = url.substr(url.rfind('/') + 1);
		requested.insert(name.substr(0, name.find('.')));
	}

	abag::output_layout layout(dir);

	auto ledger = abag::failure_ledger::load(layout.ledger_file);
	CHECK(ledger.size() == report.get_total());
	CHECK(requested.size() == report.get_total());
	for (auto &id : requested)
		CHECK(ledger.contains(id));

	REQUIRE(fs::exists(layout.summary_file));
	CHECK(read_json(layout.summary_file)["total"] == report.get_total());

	// a next run is not affected
	archive.on_request({});
	report = orchestrator.run(entries);
	CHECK(report.get_total() == entries.size());
	CHECK(abag::failure_ledger::load(layout.ledger_file).size() == entries.size());
}

// --------------------------------------------------------------------

TEST_CASE("retry_1")
{
	// A fails to download, B misses a chain. Once A becomes available a retry
	// leaves only B in the ledger.

	auto dir = scratch_dir("retry-1");
	auto cfg = test_config(dir);

	fake_archive archive;
	archive.add("2BBB.pdb", make_pdb("2BBB", { { "A", 30 }, { "H", 12 } }));
	archive.fail("1AAA.pdb", abag::errc::network_failure);
	archive.fail("1AAA.cif", abag::errc::network_failure);

	std::vector<abag::reference_entry> entries{ entry("1AAA", "H", "L", "A"), entry("2BBB", "H", "L", "A") };

	auto report = abag::run_batch(cfg, archive, entries);
	CHECK(report.get_failed() == 2);

	abag::output_layout layout(dir);

	auto ledger = abag::failure_ledger::load(layout.ledger_file);
	REQUIRE(ledger.size() == 2);
	CHECK(ledger.get("1AAA")->status == abag::status::download_failed);
	CHECK(ledger.get("2BBB")->status == abag::status::chain_not_found);
	CHECK(ledger.get("2BBB")->assignment == entries[1].assignment);

	// a normal incremental run skips entries in the ledger
	auto calls = archive.get_call_count();
	report = abag::run_batch(cfg, archive, entries);
	CHECK(report.get_failed() == 2);
	CHECK(archive.get_call_count() == calls);

	// the archive recovers
	archive.fail("1AAA.pdb", abag::errc::network_failure, 0);
	archive.add("1AAA.pdb", make_pdb("1AAA", { { "A", 30 }, { "H", 12 }, { "L", 11 } }));

	report = abag::retry_failed(cfg, archive);
	CHECK(report.get_total() == 2);
	CHECK(report.get_success() == 1);
	CHECK(report.get_count(abag::status::chain_not_found) == 1);

	ledger = abag::failure_ledger::load(layout.ledger_file);
	REQUIRE(ledger.size() == 1);
	CHECK(ledger.contains("2BBB"));
	CHECK(fs::exists(layout.get_antibody_path("1AAA")));

	// nothing changes for B, retrying it again gives the same result
	report = abag::retry_failed(cfg, archive);
	CHECK(report.get_total() == 1);
	CHECK(report.get_count(abag::status::chain_not_found) == 1);
	CHECK(abag::failure_ledger::load(layout.ledger_file).size() == 1);
}

TEST_CASE("retry_limit_1")
{
	auto dir = scratch_dir("retry-limit-1");
	auto cfg = test_config(dir);

	fake_archive archive;

	auto report = abag::run_batch(cfg, archive, {
		entry("3CCC", "H", "L", "A"),
		entry("1CCC", "H", "L", "A"),
		entry("2CCC", "H", "L", "A"),
	});
	REQUIRE(report.get_failed() == 3);

	for (auto id : { "1CCC", "2CCC", "3CCC" })
		archive.add(std::string{ id } + ".pdb", make_pdb(id, { { "A", 3 }, { "H", 3 }, { "L", 3 } }));

	cfg.limit = 2;
	report = abag::retry_failed(cfg, archive);
	CHECK(report.get_total() == 2);
	CHECK(report.get_success() == 2);

	// entries are retried in order of identifier
	auto ledger = abag::failure_ledger::load(abag::output_layout(dir).ledger_file);
	REQUIRE(ledger.size() == 1);
	CHECK(ledger.contains("3CCC"));
}

TEST_CASE("retry_empty_1")
{
	auto dir = scratch_dir("retry-empty-1");

	fake_archive archive;
	auto report = abag::retry_failed(test_config(dir), archive);

	CHECK(report.get_total() == 0);
	CHECK(archive.get_call_count() == 0);
}

// --------------------------------------------------------------------

TEST_CASE("ledger_1")
{
	auto dir = scratch_dir("ledger-1");
	auto file = dir / "failed_entries.json";

	std::ofstream(file) << R"({
	"1AAA": {
		"status": "download_failed",
		"reason": "timeout",
		"detail": "PDB: Request timed out",
		"timestamp": "2024-05-01T12:00:00Z",
		"antigen_chains": [ "A", "B" ],
		"heavy_chain": "H",
		"light_chain": null
	},
	"2BBB": {
		"status": "no_such_status"
	}
})";

	auto ledger = abag::failure_ledger::load(file);
	REQUIRE(ledger.size() == 1);

	auto e = ledger.get("1AAA");
	REQUIRE(e);
	CHECK(e->status == abag::status::download_failed);
	CHECK(e->reason == abag::errc::timeout);
	CHECK(e->timestamp == "2024-05-01T12:00:00Z");
	CHECK(e->assignment.get_antigen_chains() == std::vector<std::string>{ "A", "B" });
	CHECK(e->assignment.get_heavy_chain() == "H");
	CHECK_FALSE(e->assignment.get_light_chain());

	// a detail that is not valid UTF-8 can still be stored
	abag::outcome_record failed;
	failed.id = "3CCC";
	failed.status = abag::status::parse_failed;
	failed.reason = abag::errc::syntax_error;
	failed.detail = "unexpected character \xe9 in 3CCC.cif";
	failed.assignment = abag::chain_assignment::create({ "A" }, { "H" });
	ledger.update(failed);

	std::error_code ec;
	REQUIRE_NOTHROW(ledger.save(file, ec));
	REQUIRE_FALSE(ec);

	ledger = abag::failure_ledger::load(file);
	REQUIRE(ledger.size() == 2);
	CHECK(ledger.get("3CCC")->detail.find("3CCC.cif") != std::string::npos);
	CHECK(ledger.get("3CCC")->assignment == failed.assignment);

	std::ofstream(file) << "this is not json";
	CHECK_THROWS_AS(abag::failure_ledger::load(file), std::runtime_error);

	CHECK(abag::failure_ledger::load(dir / "missing.json").empty());
}

TEST_CASE("summary_report_1")
{
	// counts do not depend on the order of the outcomes
	abag::summary_report a, b;

	a.add(abag::status::success, {});
	a.add(abag::status::parse_failed, abag::errc::syntax_error);
	a.add(abag::status::download_failed, abag::errc::unavailable);

	b.add(abag::status::download_failed, abag::errc::unavailable);
	b.add(abag::status::success, {});
	b.add(abag::status::parse_failed, abag::errc::syntax_error);

	CHECK(a == b);
	CHECK(a.str() == b.str());

	b.add(abag::status::parse_failed, abag::errc::empty_structure);
	CHECK(a != b);
	CHECK(b.get_failure_breakdown().at("empty") == 1);

	auto j = json::parse(a.str());
	CHECK(j["total"] == 3);
	CHECK(j["by_status"]["write_failed"] == 0);
}
