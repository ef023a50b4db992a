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

#include "abag/model.hpp"
#include "abag/error.hpp"
#include "abag/text.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <numeric>
#include <stdexcept>

namespace abag
{

// --------------------------------------------------------------------

std::string_view get_extension(structure_format format)
{
	return format == structure_format::pdb ? "pdb" : "cif";
}

std::string_view to_string(structure_format format)
{
	return format == structure_format::pdb ? "PDB" : "mmCIF";
}

// --------------------------------------------------------------------

std::string normalize_identifier(std::string_view id, std::error_code &ec)
{
	std::string result = trim_copy(id);
	to_upper(result);

	if (result.length() != 4 or
		not std::all_of(result.begin(), result.end(), [](char ch)
			{ return (ch >= '0' and ch <= '9') or (ch >= 'A' and ch <= 'Z'); }))
	{
		ec = make_error_code(errc::invalid_identifier);
		result.clear();
	}

	return result;
}

std::string normalize_identifier(std::string_view id)
{
	std::error_code ec;
	auto result = normalize_identifier(id, ec);
	if (ec)
		throw std::system_error(ec, "'" + std::string{ id } + "'");
	return result;
}

// --------------------------------------------------------------------

std::string residue_number::str() const
{
	std::string result = std::to_string(m_seq_id);
	if (m_ins_code != 0)
		result += m_ins_code;
	return result;
}

residue_number residue_number::parse(std::string_view token, std::error_code &ec)
{
	while (not token.empty() and token.front() == ' ')
		token.remove_prefix(1);
	while (not token.empty() and token.back() == ' ')
		token.remove_suffix(1);

	char ins_code = 0;
	if (not token.empty() and std::isalpha(static_cast<unsigned char>(token.back())))
	{
		ins_code = token.back();
		token.remove_suffix(1);
	}

	return parse(token, std::string_view{ &ins_code, ins_code != 0 ? size_t{ 1 } : size_t{ 0 } }, ec);
}

residue_number residue_number::parse(std::string_view seq_id, std::string_view ins_code, std::error_code &ec)
{
	residue_number result;

	const char *b = seq_id.data();
	const char *e = b + seq_id.length();

	// std::from_chars does not accept a leading plus sign
	if (b != e and *b == '+')
		++b;

	auto r = std::from_chars(b, e, result.m_seq_id);

	if (b == e or r.ec != std::errc() or r.ptr != e)
		ec = make_error_code(errc::malformed_residue_numbering);
	else if (ins_code.length() == 1 and ins_code != "?" and ins_code != "." and ins_code != " ")
		result.m_ins_code = ins_code.front();
	else if (ins_code.length() > 1)
		ec = make_error_code(errc::malformed_residue_numbering);

	return result;
}

// --------------------------------------------------------------------

bool residue::is_water() const
{
	return m_compound_id == "HOH" or m_compound_id == "H2O" or m_compound_id == "OH2" or
	       m_compound_id == "WAT" or m_compound_id == "DOD";
}

bool residue::is_hetero() const
{
	return not m_atoms.empty() and
	       std::all_of(m_atoms.begin(), m_atoms.end(), [](const atom &a)
			   { return a.hetero; });
}

size_t chain::get_atom_count() const
{
	return std::accumulate(begin(), end(), size_t{ 0 }, [](size_t n, const residue &r)
		{ return n + r.atoms().size(); });
}

// --------------------------------------------------------------------

const chain *structure::get_chain(std::string_view id) const
{
	auto i = std::find_if(m_chains.begin(), m_chains.end(), [id](const chain &c)
		{ return c.get_id() == id; });
	return i == m_chains.end() ? nullptr : &*i;
}

void structure::add_chain(chain c)
{
	if (has_chain(c.get_id()))
		throw std::logic_error("duplicate chain " + c.get_id() + " in structure " + m_id);
	m_chains.emplace_back(std::move(c));
}

size_t structure::get_residue_count() const
{
	return std::accumulate(m_chains.begin(), m_chains.end(), size_t{ 0 }, [](size_t n, const chain &c)
		{ return n + c.size(); });
}

std::vector<chain_summary> summarize_chains(const structure &s)
{
	std::vector<chain_summary> result;
	for (auto &c : s.chains())
		result.push_back({ c.get_id(), c.get_residue_count() });
	return result;
}

} // namespace abag
