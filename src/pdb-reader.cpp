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
#include "abag/text.hpp"
#include "abag/utilities.hpp"

#include <iostream>
#include <regex>

namespace abag
{

namespace
{

// --------------------------------------------------------------------
// A single line in a PDB file. Column numbers are one based, as in the
// PDB format documentation.

class pdb_record
{
  public:
	pdb_record(std::string_view line)
		: m_line(line)
	{
	}

	bool is(std::string_view name) const
	{
		return m_line.substr(0, name.length()) == name;
	}

	char vC(size_t column) const
	{
		char result = ' ';
		if (column - 1 < m_line.length())
			result = m_line[column - 1];
		return result;
	}

	std::string vS(size_t column_first, size_t column_last) const
	{
		std::string result;

		if (column_first - 1 < m_line.length())
		{
			result = m_line.substr(column_first - 1, column_last - column_first + 1);
			trim(result);
		}

		return result;
	}

	std::string_view vR(size_t column_first, size_t column_last) const
	{
		if (column_first - 1 >= m_line.length())
			return {};
		return m_line.substr(column_first - 1, column_last - column_first + 1);
	}

	size_t length() const { return m_line.length(); }

  private:
	std::string_view m_line;
};

int pdb_charge(const std::string &c)
{
	static const std::regex rx(R"(([-+]?)(\d)([-+]?))");

	int result = 0;

	std::smatch m;
	if (std::regex_match(c, m, rx))
	{
		result = m[2].str()[0] - '0';
		if (m[1].str() == "-" or m[3].str() == "-")
			result = -result;
	}

	return result;
}

} // namespace

// --------------------------------------------------------------------

void read_pdb(std::string_view text, structure_builder &builder, std::error_code &ec)
{
	uint32_t line_nr = 0;

	while (not text.empty() and not ec)
	{
		auto eol = text.find('\n');
		auto line = text.substr(0, eol);
		text.remove_prefix(eol == std::string_view::npos ? text.length() : eol + 1);

		++line_nr;

		if (not line.empty() and line.back() == '\r')
			line.remove_suffix(1);

		pdb_record r(line);

		// only the first model is used
		if (r.is("ENDMDL"))
			break;

		if (not(r.is("ATOM  ") or r.is("HETATM")))
			continue;

		if (r.length() < 54)
		{
			if (VERBOSE > 0)
				std::cerr << "Atom record too short at line " << line_nr << '\n';
			ec = make_error_code(errc::syntax_error);
			break;
		}

		atom a;

		a.hetero = r.is("HETATM");

		//	 7 - 11        Integer       serial       Atom serial number.
		// serials may be in hybrid-36 format in large files, they are renumbered on write anyway
		if (not parse_number(r.vR(7, 11), a.serial))
			a.serial = 0;

		a.name = r.vS(13, 16);            //	13 - 16        Atom          name         Atom name.
		char alt_loc = r.vC(17);          //	17             Character     altLoc       Alternate location indicator.
		std::string res_name = r.vS(18, 21); //	18 - 20        Residue name  resName      Residue name, column 21 is used by some programs.
		char chain_id = r.vC(22);         //	22             Character     chainID      Chain identifier.

		//	23 - 26        Integer       resSeq       Residue sequence number.
		//	27             AChar         iCode        Code for insertion of residues.
		auto nr = residue_number::parse(r.vR(23, 27), ec);
		if (ec)
		{
			if (VERBOSE > 0)
				std::cerr << "Invalid residue number '" << r.vR(23, 27) << "' at line " << line_nr << '\n';
			break;
		}

		//	31 - 38        Real(8.3)     x            Orthogonal coordinates for X in Angstroms.
		//	39 - 46        Real(8.3)     y            Orthogonal coordinates for Y in Angstroms.
		//	47 - 54        Real(8.3)     z            Orthogonal coordinates for Z in Angstroms.
		if (not parse_number(r.vR(31, 38), a.x) or
			not parse_number(r.vR(39, 46), a.y) or
			not parse_number(r.vR(47, 54), a.z))
		{
			if (VERBOSE > 0)
				std::cerr << "Invalid coordinates at line " << line_nr << '\n';
			ec = make_error_code(errc::syntax_error);
			break;
		}

		//	55 - 60        Real(6.2)     occupancy    Occupancy.
		if (not parse_number(r.vR(55, 60), a.occupancy))
			a.occupancy = 1;

		//	61 - 66        Real(6.2)     tempFactor   Temperature  factor.
		if (not parse_number(r.vR(61, 66), a.b_factor))
			a.b_factor = 0;

		a.element = r.vS(77, 78);            //	77 - 78        LString(2)    element      Element symbol, right-justified.
		a.charge = pdb_charge(r.vS(79, 80)); //	79 - 80        LString(2)    charge       Charge  on the atom.

		if (alt_loc != ' ')
			a.alt_id = alt_loc;

		builder.add_atom(std::string_view{ &chain_id, 1 }, nr, res_name, std::move(a));
	}
}

} // namespace abag
