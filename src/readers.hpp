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
#include "abag/parser.hpp"

#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace abag
{

// --------------------------------------------------------------------
// The structure_builder collects atoms as they are read from a file and
// groups them into residues and chains. Both readers below feed it.

class structure_builder
{
  public:
	structure_builder(std::string id, structure_format format, const parse_options &options)
		: m_id(std::move(id))
		, m_format(format)
		, m_options(options)
	{
	}

	structure_builder(const structure_builder &) = delete;
	structure_builder &operator=(const structure_builder &) = delete;

	void add_atom(std::string_view chain_id, residue_number nr, std::string_view compound_id, atom a);

	size_t get_atom_count() const { return m_atom_count; }

	/// Returns the assembled structure, sets @a ec to errc::empty_structure
	/// if no atoms were added at all
	structure finish(std::error_code &ec);

  private:
	struct chain_data
	{
		chain m_chain;
		std::map<std::pair<int, char>, size_t> m_residue_index;
	};

	std::string m_id;
	structure_format m_format;
	parse_options m_options;

	std::vector<chain_data> m_chains;
	std::map<std::string, size_t, std::less<>> m_chain_index;
	size_t m_atom_count = 0;
};

// --------------------------------------------------------------------

/// Parse @a s as a floating point number, returns false if it is not one
bool parse_number(std::string_view s, float &v);

/// Parse @a s as an integer, returns false if it is not one
bool parse_number(std::string_view s, int &v);

/// Read the ATOM and HETATM records of the first model in @a text
void read_pdb(std::string_view text, structure_builder &builder, std::error_code &ec);

/// Read the atom_site records of the first model in the first data block in @a text
void read_mmcif(std::string_view text, structure_builder &builder, std::error_code &ec);

} // namespace abag
