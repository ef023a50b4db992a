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

#include "abag/config.hpp"
#include "abag/error.hpp"
#include "abag/utilities.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace abag
{

// --------------------------------------------------------------------

output_layout::output_layout(const fs::path &output_dir)
	: root(output_dir)
	, raw_dir(output_dir / "raw")
	, antigen_dir(output_dir / "processed" / "antigens")
	, antibody_dir(output_dir / "processed" / "antibodies")
	, ledger_file(output_dir / "failed_entries.json")
	, summary_file(output_dir / "processing_summary.json")
{
}

fs::path output_layout::get_raw_path(const std::string &id, structure_format format) const
{
	return raw_dir / (id + '.' + std::string{ get_extension(format) });
}

fs::path output_layout::get_antigen_path(const std::string &id) const
{
	return antigen_dir / (id + "_antigen.pdb");
}

fs::path output_layout::get_antibody_path(const std::string &id) const
{
	return antibody_dir / (id + "_antibody.pdb");
}

// --------------------------------------------------------------------

config::config()
{
	const char *url = getenv("ABAG_ARCHIVE_URL");
	if (url != nullptr and *url != 0)
		archive_url = url;
}

uint32_t config::get_worker_count() const
{
	uint32_t result = parallelism;

	if (result == 0)
		result = std::thread::hardware_concurrency();

	return result > 0 ? result : 1;
}

void config::ensure_directories() const
{
	auto layout = get_layout();

	for (auto &dir : { layout.raw_dir, layout.antigen_dir, layout.antibody_dir })
	{
		std::error_code ec;
		fs::create_directories(dir, ec);
		if (ec)
			throw std::runtime_error("Could not create directory " + dir.string() + ": " + ec.message());
	}

	// creating directories succeeds when they exist, that does not mean we can write in them
	std::error_code ec;
	auto probe = layout.root / ".abag-write-test";
	write_file_atomically(probe, "", ec);
	if (ec)
		throw std::runtime_error("Output directory " + layout.root.string() + " is not writable");

	fs::remove(probe, ec);

	if (VERBOSE > 1)
		std::cerr << "Using output directory " << layout.root << '\n';
}

} // namespace abag
