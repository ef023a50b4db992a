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

#include "abag/writer.hpp"
#include "abag/error.hpp"
#include "abag/format.hpp"
#include "abag/utilities.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace abag
{

namespace
{

void write_atom(std::ostream &os, int serial, const residue &res, const std::string &chain_id, const atom &a)
{
	std::string name = a.name;
	const std::string &element = a.element;

	// Atom names start in column 14 unless the element symbol takes two characters
	if (not name.empty() and name.length() < 4 and (element.length() == 1 or std::toupper(name[0]) != std::toupper(element[0]) or std::toupper(name[1]) != std::toupper(element[1])))
		name.insert(name.begin(), ' ');

	std::string charge;
	if (a.charge != 0)
		charge = std::to_string(std::abs(a.charge)) + (a.charge > 0 ? '+' : '-');

	std::string ins_code;
	if (res.get_number().has_ins_code())
		ins_code = res.get_number().get_ins_code();

	os << format("%-6.6s%5d %-4.4s%1.1s%3.3s %1.1s%4d%1.1s   %8.3f%8.3f%8.3f%6.2f%6.2f          %2.2s%2.2s",
			  a.hetero ? "HETATM" : "ATOM", serial, name, a.alt_id, res.get_compound_id(), chain_id,
			  res.get_number().get_seq_id(), ins_code, a.x, a.y, a.z, a.occupancy, a.b_factor, element, charge)
	   << '\n';
}

void write_ter(std::ostream &os, int serial, const residue &res, const std::string &chain_id)
{
	std::string ins_code;
	if (res.get_number().has_ins_code())
		ins_code = res.get_number().get_ins_code();

	os << format("TER   %5d      %3.3s %1.1s%4d%1.1s", serial, res.get_compound_id(), chain_id,
			  res.get_number().get_seq_id(), ins_code)
	   << '\n';
}

} // namespace

// --------------------------------------------------------------------

void write(std::ostream &os, const structure &s, std::error_code &ec)
{
	for (auto &c : s.chains())
	{
		if (c.get_id().length() > 1)
		{
			if (VERBOSE > 0)
				std::cerr << "Chain ID " << c.get_id() << " of " << s.get_id() << " won't fit into a PDB file\n";
			ec = make_error_code(errc::io_failure);
			return;
		}
	}

	int serial = 1;

	for (auto &c : s.chains())
	{
		for (auto &res : c)
		{
			for (auto &a : res.atoms())
				write_atom(os, serial++, res, c.get_id(), a);
		}

		if (not c.empty())
			write_ter(os, serial++, c.back(), c.get_id());
	}

	os << "END" << '\n';

	if (not os)
		ec = make_error_code(errc::io_failure);
}

void write(const fs::path &file, const structure &s, std::error_code &ec)
{
	std::ostringstream os;
	write(os, s, ec);

	if (not ec)
		write_file_atomically(file, os.str(), ec);

	if (ec and VERBOSE > 0)
		std::cerr << "Could not write " << file << '\n';
}

} // namespace abag
