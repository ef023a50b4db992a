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

#include "abag/model.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

/**
 * @file parser.hpp
 *
 * Parsing of raw structure files into the format independent model of
 * model.hpp. The format of the data is always known in advance, it is
 * determined by the file that was fetched and carried in the type of
 * the raw_structure variant.
 */

namespace abag
{

// --------------------------------------------------------------------

/// \brief The contents of a legacy PDB formatted file
struct pdb_data
{
	std::string text;
};

/// \brief The contents of an mmCIF formatted file
struct mmcif_data
{
	std::string text;
};

/// \brief Raw file contents, tagged with their format
using raw_structure = std::variant<pdb_data, mmcif_data>;

/// \brief Return the format of the data in @a raw
structure_format get_format(const raw_structure &raw);

// --------------------------------------------------------------------

/// \brief Residue filters applied while building the structure
struct parse_options
{
	bool remove_water = false;  ///< Drop water molecules
	bool remove_hetero = false; ///< Drop residues consisting of HETATM records only
};

/**
 * @brief Parse the data in @a raw into a structure with identifier @a id.
 *
 * Atoms are grouped into residues by residue number and insertion code,
 * residues into chains by chain identifier. Both keep the order in which
 * they were first seen. Only the first model of a multi model file is
 * used.
 *
 * On failure @a ec is set to one of:
 *
 * - errc::malformed_residue_numbering if a residue number is not an
 *   integer with an optional single character insertion code
 * - errc::empty_structure if no atom records were found at all
 * - errc::syntax_error if the data could not be tokenised
 */
structure parse(std::string_view id, const raw_structure &raw, const parse_options &options, std::error_code &ec);

/// \brief Version of parse that throws a std::system_error on failure
structure parse(std::string_view id, const raw_structure &raw, const parse_options &options = {});

// --------------------------------------------------------------------

/**
 * @brief Return the format for the file @a file based on its extension,
 * a trailing .gz is ignored. Sets @a ec to errc::io_failure if the
 * extension is not recognised.
 */
structure_format format_for_path(const std::filesystem::path &file, std::error_code &ec);

/**
 * @brief Read the file @a file, which may be gzip compressed, and return
 * its contents tagged with the format derived from its extension.
 * Sets @a ec to errc::io_failure when the file cannot be read.
 */
raw_structure load(const std::filesystem::path &file, std::error_code &ec);

} // namespace abag
