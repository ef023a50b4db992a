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

namespace fs = std::filesystem;

// --------------------------------------------------------------------

namespace
{

// An entry with an antigen (A) of 333 residues and a Fab with heavy (H)
// and light (L) chains
fake_archive &add_6oej(fake_archive &archive)
{
	archive.add("6OEJ.pdb", make_pdb("6OEJ", { { "H", 227 }, { "L", 215 }, { "A", 333 } }));
	return archive;
}

const char kLongChainCIF[] = R"(data_8LNG
loop_
_atom_site.group_PDB
_atom_site.id
_atom_site.type_symbol
_atom_site.label_atom_id
_atom_site.label_comp_id
_atom_site.label_asym_id
_atom_site.label_seq_id
_atom_site.Cartn_x
_atom_site.Cartn_y
_atom_site.Cartn_z
_atom_site.auth_seq_id
_atom_site.auth_asym_id
ATOM 1 C CA GLY A 1 1.0 2.0 3.0 1 AA
ATOM 2 C CA GLY B 1 1.0 2.0 3.0 1 H
)";

} // namespace

// --------------------------------------------------------------------

TEST_CASE("process_1")
{
	auto dir = scratch_dir("process-1");

	fake_archive archive;
	abag::entry_processor processor(test_config(dir), add_6oej(archive));

	auto r = processor.process("6oej", abag::chain_assignment::create({ "A" }, { "H", "L" }));

	CHECK(r.succeeded());
	CHECK(r.id == "6OEJ");
	CHECK_FALSE(r.reason);
	CHECK(r.format == abag::structure_format::pdb);
	CHECK(r.antigen_residues == 333);
	CHECK(r.antibody_residues == 442);
	CHECK(r.started <= r.finished);

	abag::output_layout layout(dir);
	REQUIRE(fs::exists(layout.get_antigen_path("6OEJ")));
	REQUIRE(fs::exists(layout.get_antibody_path("6OEJ")));

	std::error_code ec;
	auto antigen = abag::parse("6OEJ", abag::load(layout.get_antigen_path("6OEJ"), ec));
	REQUIRE_FALSE(ec);
	CHECK(abag::summarize_chains(antigen) == std::vector<abag::chain_summary>{ { "A", 333 } });

	auto antibody = abag::parse("6OEJ", abag::load(layout.get_antibody_path("6OEJ"), ec));
	REQUIRE_FALSE(ec);
	CHECK(abag::summarize_chains(antibody) == std::vector<abag::chain_summary>{ { "H", 227 }, { "L", 215 } });
}

TEST_CASE("process_up_to_date_1")
{
	auto dir = scratch_dir("process-up-to-date-1");
	auto cfg = test_config(dir);

	fake_archive archive;
	abag::entry_processor processor(cfg, add_6oej(archive));

	auto assignment = abag::chain_assignment::create({ "A" }, { "H", "L" });

	REQUIRE(processor.process("6OEJ", assignment).succeeded());
	REQUIRE(archive.get_call_count() == 1);

	auto r = processor.process("6OEJ", assignment);
	CHECK(r.succeeded());
	CHECK(r.detail == "up to date");
	CHECK(archive.get_call_count() == 1);

	// force processes the entry again, including the download
	r = processor.process("6OEJ", assignment, true);
	CHECK(r.succeeded());
	CHECK(r.antigen_residues == 333);
	CHECK(archive.get_call_count() == 2);
}

TEST_CASE("process_chain_not_found_1")
{
	auto dir = scratch_dir("process-chain-not-found-1");

	fake_archive archive;
	abag::entry_processor processor(test_config(dir), add_6oej(archive));

	auto r = processor.process("6OEJ", abag::chain_assignment::create({ "A" }, { "H", "X" }));

	CHECK(r.status == abag::status::chain_not_found);
	CHECK(r.reason == abag::errc::chain_not_found);
	CHECK(r.detail.find('X') != std::string::npos);

	// no partial output
	abag::output_layout layout(dir);
	CHECK_FALSE(fs::exists(layout.get_antigen_path("6OEJ")));
	CHECK_FALSE(fs::exists(layout.get_antibody_path("6OEJ")));
}

TEST_CASE("process_download_failed_1")
{
	auto dir = scratch_dir("process-download-failed-1");

	fake_archive archive;
	abag::entry_processor processor(test_config(dir), archive);

	auto r = processor.process("1XXX", abag::chain_assignment::create({ "A" }, { "H" }));
	CHECK(r.status == abag::status::download_failed);
	CHECK(r.reason == abag::errc::unavailable);
	CHECK_FALSE(r.format);

	r = processor.process("1XXXX", abag::chain_assignment::create({ "A" }, { "H" }));
	CHECK(r.status == abag::status::download_failed);
	CHECK(r.reason == abag::errc::invalid_identifier);
}

TEST_CASE("process_parse_failed_1")
{
	auto dir = scratch_dir("process-parse-failed-1");

	fake_archive archive;
	archive.add("5BAD.pdb", "HEADER    NO COORDINATES\nEND\n");
	archive.add("6BAD.pdb", "ATOM      1  CA  GLY A  1X2      1.000   1.000   1.000  1.00  1.00           C\n");

	abag::entry_processor processor(test_config(dir), archive);
	auto assignment = abag::chain_assignment::create({ "A" }, { "H" });

	auto r = processor.process("5BAD", assignment);
	CHECK(r.status == abag::status::parse_failed);
	CHECK(r.reason == abag::errc::empty_structure);
	CHECK(r.format == abag::structure_format::pdb);

	r = processor.process("6BAD", assignment);
	CHECK(r.status == abag::status::parse_failed);
	CHECK(r.reason == abag::errc::malformed_residue_numbering);
}

TEST_CASE("process_write_failed_1")
{
	auto dir = scratch_dir("process-write-failed-1");

	fake_archive archive;
	archive.add("8LNG.cif", kLongChainCIF);

	abag::entry_processor processor(test_config(dir), archive);

	auto r = processor.process("8LNG", abag::chain_assignment::create({ "AA" }, { "H" }));
	CHECK(r.status == abag::status::write_failed);
	CHECK(r.reason == abag::errc::io_failure);
	CHECK(r.detail.find("AA") != std::string::npos);
	CHECK(r.format == abag::structure_format::mmcif);

	abag::output_layout layout(dir);
	CHECK_FALSE(fs::exists(layout.get_antigen_path("8LNG")));

	// the antigen side can be written, the antibody side cannot
	r = processor.process("8LNG", abag::chain_assignment::create({ "H" }, { "AA" }));
	CHECK(r.status == abag::status::write_failed);
	CHECK(r.reason == abag::errc::io_failure);
	CHECK(r.detail.find("AA") != std::string::npos);

	CHECK_FALSE(fs::exists(layout.get_antigen_path("8LNG")));
	CHECK_FALSE(fs::exists(layout.get_antibody_path("8LNG")));
}

TEST_CASE("process_write_failed_2")
{
	// committing the antibody file fails after the antigen file was written

	auto dir = scratch_dir("process-write-failed-2");

	fake_archive archive;
	add_6oej(archive);

	abag::output_layout layout(dir);
	fs::create_directories(layout.antigen_dir);
	fs::create_directories(layout.antibody_dir / "6OEJ_antibody.pdb" / "in-the-way");

	abag::entry_processor processor(test_config(dir), archive);

	auto r = processor.process("6OEJ", abag::chain_assignment::create({ "A" }, { "H", "L" }));
	CHECK(r.status == abag::status::write_failed);
	CHECK(r.reason == abag::errc::io_failure);

	CHECK_FALSE(fs::exists(layout.get_antigen_path("6OEJ")));
	CHECK(fs::is_directory(layout.get_antibody_path("6OEJ")));
}

// --------------------------------------------------------------------

TEST_CASE("process_one_1")
{
	auto dir = scratch_dir("process-one-1");
	auto cfg = test_config(dir);

	fake_archive archive;
	add_6oej(archive);

	auto r = abag::process_one(cfg, archive, "6OEJ", { "A" }, { "H", "X" });
	CHECK(r.status == abag::status::chain_not_found);

	auto ledger = abag::failure_ledger::load(cfg.get_layout().ledger_file);
	REQUIRE(ledger.contains("6OEJ"));
	CHECK(ledger.get("6OEJ")->status == abag::status::chain_not_found);

	// fixing the assignment clears the ledger entry
	r = abag::process_one(cfg, archive, "6OEJ", { "A" }, { "H", "L" });
	CHECK(r.succeeded());

	ledger = abag::failure_ledger::load(cfg.get_layout().ledger_file);
	CHECK(ledger.empty());
}

TEST_CASE("process_one_2")
{
	auto dir = scratch_dir("process-one-2");
	auto cfg = test_config(dir);

	fake_archive archive;

	CHECK_THROWS_AS(abag::process_one(cfg, archive, "6OE", { "A" }, { "H" }), std::system_error);
	CHECK_THROWS_AS(abag::process_one(cfg, archive, "6OEJ", { "A" }, { "A" }), std::system_error);
	CHECK_THROWS_AS(abag::process_one(cfg, archive, "6OEJ", {}, { "H" }), std::system_error);

	CHECK(archive.get_call_count() == 0);
}

// --------------------------------------------------------------------

TEST_CASE("inspect_chains_1")
{
	auto dir = scratch_dir("inspect-chains-1");
	auto cfg = test_config(dir);

	fake_archive archive;
	add_6oej(archive);

	std::error_code ec;
	auto chains = abag::inspect_chains(cfg, archive, "6oej", ec);
	REQUIRE_FALSE(ec);

	CHECK(chains == std::vector<abag::chain_summary>{ { "H", 227 }, { "L", 215 }, { "A", 333 } });

	// the raw file is kept, a second call does not download again
	chains = abag::inspect_chains(cfg, archive, "6OEJ", ec);
	REQUIRE_FALSE(ec);
	CHECK(chains.size() == 3);
	CHECK(archive.get_call_count() == 1);

	abag::inspect_chains(cfg, archive, "1XXX", ec);
	CHECK(ec == abag::errc::unavailable);
}
