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

#include "abag/parser.hpp"
#include "abag/error.hpp"
#include "abag/gzip.hpp"
#include "abag/text.hpp"
#include "abag/utilities.hpp"

#include "readers.hpp"

#include <iostream>
#include <type_traits>

namespace fs = std::filesystem;

namespace abag
{

// --------------------------------------------------------------------

structure_format get_format(const raw_structure &raw)
{
	return std::holds_alternative<pdb_data>(raw) ? structure_format::pdb : structure_format::mmcif;
}

structure parse(std::string_view id, const raw_structure &raw, const parse_options &options, std::error_code &ec)
{
	structure_builder builder(std::string{ id }, get_format(raw), options);

	std::visit([&builder, &ec](auto &&data)
		{
			using T = std::decay_t<decltype(data)>;
			if constexpr (std::is_same_v<T, pdb_data>)
				read_pdb(data.text, builder, ec);
			else
				read_mmcif(data.text, builder, ec);
		},
		raw);

	if (ec)
		return {};

	auto result = builder.finish(ec);

	if (VERBOSE > 1 and not ec)
		std::cerr << "Parsed " << id << " (" << to_string(result.get_format()) << "): "
				  << result.chains().size() << " chains, " << result.get_residue_count() << " residues, "
				  << builder.get_atom_count() << " atoms\n";

	return result;
}

structure parse(std::string_view id, const raw_structure &raw, const parse_options &options)
{
	std::error_code ec;
	auto result = parse(id, raw, options, ec);
	if (ec)
		throw std::system_error(ec, "Error parsing " + std::string{ id });
	return result;
}

// --------------------------------------------------------------------

structure_format format_for_path(const fs::path &file, std::error_code &ec)
{
	auto p = file;
	if (iequals(p.extension().string(), ".gz"))
		p = p.stem();

	auto ext = p.extension().string();

	structure_format result = structure_format::pdb;

	if (iequals(ext, ".pdb") or iequals(ext, ".ent"))
		result = structure_format::pdb;
	else if (iequals(ext, ".cif") or iequals(ext, ".mmcif"))
		result = structure_format::mmcif;
	else
		ec = make_error_code(errc::io_failure);

	return result;
}

raw_structure load(const fs::path &file, std::error_code &ec)
{
	auto format = format_for_path(file, ec);
	if (ec)
	{
		if (VERBOSE > 0)
			std::cerr << "Unknown file type for " << file << '\n';
		return {};
	}

	auto text = read_file(file, ec);
	if (ec)
		return {};

	if (format == structure_format::pdb)
		return pdb_data{ std::move(text) };
	else
		return mmcif_data{ std::move(text) };
}

} // namespace abag
