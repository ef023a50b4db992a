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

#include "readers.hpp"
#include "abag/error.hpp"
#include "abag/utilities.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>

namespace abag
{

void structure_builder::add_atom(std::string_view chain_id, residue_number nr, std::string_view compound_id, atom a)
{
	++m_atom_count;

	auto ci = m_chain_index.find(chain_id);
	if (ci == m_chain_index.end())
	{
		ci = m_chain_index.emplace(std::string{ chain_id }, m_chains.size()).first;
		m_chains.push_back({ chain{ std::string{ chain_id } }, {} });
	}

	auto &cd = m_chains[ci->second];

	auto key = std::make_pair(nr.get_seq_id(), nr.get_ins_code());
	auto ri = cd.m_residue_index.find(key);
	if (ri == cd.m_residue_index.end())
	{
		ri = cd.m_residue_index.emplace(key, cd.m_chain.size()).first;
		cd.m_chain.emplace_back(nr, std::string{ compound_id });
	}

	auto &res = cd.m_chain[ri->second];

	if (VERBOSE > 3 and res.get_compound_id() != compound_id)
		std::cerr << "Residue " << chain_id << ' ' << nr.str() << " has atoms with compound " << compound_id
				  << " as well as " << res.get_compound_id() << '\n';

	res.add_atom(std::move(a));
}

structure structure_builder::finish(std::error_code &ec)
{
	structure result(m_id, m_format);

	if (m_atom_count == 0)
	{
		ec = make_error_code(errc::empty_structure);
		return result;
	}

	for (auto &cd : m_chains)
	{
		chain c(cd.m_chain.get_id());

		for (auto &res : cd.m_chain)
		{
			if (m_options.remove_water and res.is_water())
				continue;

			if (m_options.remove_hetero and res.is_hetero())
				continue;

			c.emplace_back(std::move(res));
		}

		if (c.empty())
		{
			if (VERBOSE > 1)
				std::cerr << "Dropping chain " << c.get_id() << " of " << m_id << " since it has no residues left\n";
			continue;
		}

		result.add_chain(std::move(c));
	}

	m_chains.clear();
	m_chain_index.clear();

	return result;
}

// --------------------------------------------------------------------

bool parse_number(std::string_view s, float &v)
{
	while (not s.empty() and s.front() == ' ')
		s.remove_prefix(1);
	while (not s.empty() and s.back() == ' ')
		s.remove_suffix(1);

	// strtof needs a null terminated string, coordinates are short
	char buffer[64];
	if (s.empty() or s.length() >= sizeof(buffer))
		return false;

	s.copy(buffer, s.length());
	buffer[s.length()] = 0;

	char *end;
	v = std::strtof(buffer, &end);

	return end == buffer + s.length();
}

bool parse_number(std::string_view s, int &v)
{
	while (not s.empty() and s.front() == ' ')
		s.remove_prefix(1);
	while (not s.empty() and s.back() == ' ')
		s.remove_suffix(1);

	const char *b = s.data();
	const char *e = b + s.length();

	if (b != e and *b == '+')
		++b;

	auto r = std::from_chars(b, e, v);
	return b != e and r.ec == std::errc() and r.ptr == e;
}

} // namespace abag
