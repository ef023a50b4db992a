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
#include <abag/gzip.hpp>
#include <abag/text.hpp>

#include <fstream>
#include <random>
#include <thread>

#include <zlib.h>

namespace fs = std::filesystem;

// --------------------------------------------------------------------

TEST_CASE("progress_1")
{
	std::random_device rd;
	std::mt19937 gen(rd());
	std::uniform_int_distribution<> distrib(10, 100);

	abag::progress_bar pb(10, "test");

	for (int i = 0; i < 10; ++i)
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(distrib(gen)));

		pb.message("step " + std::to_string(i));
		pb.consumed(1);
	}
}

TEST_CASE("progress_2")
{
	abag::progress_bar pb(10, "test");

	for (int i = 0; i < 5; ++i)
		pb.consumed(1);
}

TEST_CASE("progress_3")
{
	using namespace std::literals;

	abag::progress_bar pb(10, "test");
	pb.consumed(10);

	std::this_thread::sleep_for(100ms);
}

// --------------------------------------------------------------------

TEST_CASE("atomic_write_1")
{
	auto dir = scratch_dir("atomic-write-1");
	auto file = dir / "summary.json";

	std::error_code ec;
	abag::write_file_atomically(file, "first", ec);
	REQUIRE_FALSE(ec);

	abag::write_file_atomically(file, "second version", ec);
	REQUIRE_FALSE(ec);

	std::ifstream in(file);
	std::string text;
	std::getline(in, text);
	CHECK(text == "second version");

	// only the final file remains
	CHECK(std::distance(fs::directory_iterator(dir), fs::directory_iterator()) == 1);

	auto tmp = abag::temporary_path_for(file);
	CHECK(tmp.parent_path().string() == file.parent_path().string());
	CHECK(tmp.extension().string() == ".part");
	CHECK(tmp.filename().string().front() == '.');
}

TEST_CASE("atomic_write_2")
{
	auto dir = scratch_dir("atomic-write-2");

	std::error_code ec;
	abag::write_file_atomically(dir / "no-such-dir" / "file.json", "data", ec);
	CHECK(ec == abag::errc::io_failure);
}

TEST_CASE("ensure_directories_1")
{
	auto dir = scratch_dir("ensure-directories-1");

	abag::config cfg(dir / "out");
	cfg.ensure_directories();

	auto layout = cfg.get_layout();
	CHECK(fs::is_directory(layout.raw_dir));
	CHECK(fs::is_directory(layout.antigen_dir));
	CHECK(fs::is_directory(layout.antibody_dir));

	// a file where the output directory should be
	std::ofstream(dir / "file") << "x";
	abag::config bad(dir / "file");
	CHECK_THROWS_AS(bad.ensure_directories(), std::runtime_error);
}

TEST_CASE("config_1")
{
	abag::config cfg;

	CHECK(cfg.download_attempts == 3);
	CHECK(cfg.incremental);
	CHECK_FALSE(cfg.force);
	CHECK_FALSE(cfg.limit);

	cfg.parallelism = 0;
	CHECK(cfg.get_worker_count() >= 1);

	cfg.parallelism = 6;
	CHECK(cfg.get_worker_count() == 6);

	abag::output_layout layout("/data/abag");
	CHECK(layout.get_raw_path("6OEJ", abag::structure_format::mmcif).string() == "/data/abag/raw/6OEJ.cif");
	CHECK(layout.get_antigen_path("6OEJ").string() == "/data/abag/processed/antigens/6OEJ_antigen.pdb");
	CHECK(layout.get_antibody_path("6OEJ").string() == "/data/abag/processed/antibodies/6OEJ_antibody.pdb");
	CHECK(layout.ledger_file.filename().string() == "failed_entries.json");
	CHECK(layout.summary_file.filename().string() == "processing_summary.json");
}

// --------------------------------------------------------------------

TEST_CASE("gzip_1")
{
	const std::string text = "HEADER    COMPRESSED\n";

	// two concatenated gzip members
	auto dir = scratch_dir("gzip-1");
	auto file = dir / "1ABC.pdb.gz";

	for (int i = 0; i < 2; ++i)
	{
		gzFile gz = gzopen(file.string().c_str(), "ab");
		REQUIRE(gz != nullptr);
		gzwrite(gz, text.data(), static_cast<unsigned>(text.length()));
		REQUIRE(gzclose(gz) == Z_OK);
	}

	std::error_code ec;
	auto data = abag::read_file(file, ec);
	REQUIRE_FALSE(ec);
	CHECK(data == text + text);

	// plain files are read as is
	std::ofstream(dir / "plain.pdb") << text;
	data = abag::read_file(dir / "plain.pdb", ec);
	REQUIRE_FALSE(ec);
	CHECK(data == text);
	CHECK_FALSE(abag::is_gzip(data));

	abag::gunzip("\x1f\x8b garbage", ec);
	CHECK(ec == abag::errc::io_failure);
}

// --------------------------------------------------------------------

TEST_CASE("text_1")
{
	CHECK(abag::iequals("atom_site", "ATOM_SITE"));
	CHECK_FALSE(abag::iequals("atom_site", "atom_sites"));

	CHECK(abag::trim_copy("  A \t") == "A");

	CHECK(abag::split<std::string>("A|B||C", "|") == std::vector<std::string>{ "A", "B", "", "C" });
	CHECK(abag::split<std::string>("A|B||C", "|", true) == std::vector<std::string>{ "A", "B", "C" });

	CHECK(abag::join(std::vector<std::string>{ "H", "L" }, ",") == "H,L");
}
