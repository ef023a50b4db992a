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
#include "abag/cif-parser.hpp"
#include "abag/error.hpp"
#include "abag/text.hpp"
#include "abag/utilities.hpp"

#include <array>
#include <iostream>

namespace abag
{

namespace
{

// --------------------------------------------------------------------
// The items of the atom_site category that are used

enum atom_site_item
{
	kGroupPDB,
	kID,
	kTypeSymbol,
	kLabelAtomID,
	kAuthAtomID,
	kLabelAltID,
	kLabelCompID,
	kAuthCompID,
	kLabelAsymID,
	kAuthAsymID,
	kLabelSeqID,
	kAuthSeqID,
	kInsCode,
	kCartnX,
	kCartnY,
	kCartnZ,
	kOccupancy,
	kBIso,
	kFormalCharge,
	kModelNum,

	kItemCount,
	kUnusedItem = kItemCount
};

const std::array<const char *, kItemCount> kItemNames = {
	"group_PDB",
	"id",
	"type_symbol",
	"label_atom_id",
	"auth_atom_id",
	"label_alt_id",
	"label_comp_id",
	"auth_comp_id",
	"label_asym_id",
	"auth_asym_id",
	"label_seq_id",
	"auth_seq_id",
	"pdbx_PDB_ins_code",
	"Cartn_x",
	"Cartn_y",
	"Cartn_z",
	"occupancy",
	"B_iso_or_equiv",
	"pdbx_formal_charge",
	"pdbx_PDB_model_num"
};

bool is_null(std::string_view v)
{
	return v.empty() or v == "?" or v == ".";
}

// --------------------------------------------------------------------
// A sac_parser that only looks at the atom_site category and passes
// each row of the first model on to a structure_builder

class atom_site_parser : public sac_parser
{
  public:
	atom_site_parser(std::string_view text, structure_builder &builder)
		: sac_parser(text)
		, m_builder(builder)
	{
	}

	void parse()
	{
		parse_first_datablock();
		finish_row();
	}

  protected:
	void produce_datablock(std::string_view name) override
	{
		if (VERBOSE > 3)
			std::cerr << "reading data_" << name << '\n';
	}

	void produce_category(std::string_view name) override
	{
		finish_row();

		m_in_atom_site = iequals(name, "atom_site");
		m_columns.clear();
	}

	void produce_row() override
	{
		finish_row();

		if (m_in_atom_site)
		{
			m_values.fill({});
			m_row_pending = true;
			m_column = 0;
		}
	}

	void produce_item(std::string_view category, std::string_view item, std::string_view value) override
	{
		if (not m_in_atom_site)
			return;

		// items in a loop_ come in the same order for each row, cache their index
		if (m_column >= m_columns.size() or m_columns[m_column].first != item)
		{
			size_t ix = kUnusedItem;
			for (size_t i = 0; i < kItemCount; ++i)
			{
				if (iequals(item, kItemNames[i]))
				{
					ix = i;
					break;
				}
			}

			if (m_column >= m_columns.size())
				m_columns.resize(m_column + 1);
			m_columns[m_column] = { std::string{ item }, ix };
		}

		auto ix = m_columns[m_column++].second;
		if (ix != kUnusedItem)
			m_values[ix] = value;
	}

  private:
	std::string_view get(atom_site_item item) const
	{
		return m_values[item];
	}

	/// Return the value of @a preferred, or @a fallback if that is null
	std::string_view get(atom_site_item preferred, atom_site_item fallback) const
	{
		return is_null(m_values[preferred]) ? m_values[fallback] : m_values[preferred];
	}

	void finish_row();

	structure_builder &m_builder;

	bool m_in_atom_site = false;
	bool m_row_pending = false;
	std::string m_model;

	std::vector<std::pair<std::string, size_t>> m_columns;
	size_t m_column = 0;

	// The values point into the text that is parsed
	std::array<std::string_view, kItemCount> m_values;
};

void atom_site_parser::finish_row()
{
	if (not m_row_pending)
		return;

	m_row_pending = false;

	if (get_error())
		return;

	// only the first model is used
	auto model = get(kModelNum);
	if (not is_null(model))
	{
		if (m_model.empty())
			m_model = model;
		else if (m_model != model)
			return;
	}

	auto chain_id = get(kAuthAsymID, kLabelAsymID);
	if (is_null(chain_id))
	{
		error("atom_site record without chain identifier");
		return;
	}

	std::error_code ec;
	auto nr = residue_number::parse(get(kAuthSeqID, kLabelSeqID), get(kInsCode), ec);
	if (ec)
	{
		error(ec, "invalid residue number '" + std::string{ get(kAuthSeqID, kLabelSeqID) } + "'");
		return;
	}

	atom a;

	a.hetero = iequals(get(kGroupPDB), "HETATM");

	if (not parse_number(get(kID), a.serial))
		a.serial = 0;

	a.name = get(kAuthAtomID, kLabelAtomID);

	if (not is_null(get(kLabelAltID)))
		a.alt_id = get(kLabelAltID);

	if (not parse_number(get(kCartnX), a.x) or
		not parse_number(get(kCartnY), a.y) or
		not parse_number(get(kCartnZ), a.z))
	{
		error("invalid or missing coordinates");
		return;
	}

	if (not parse_number(get(kOccupancy), a.occupancy))
		a.occupancy = 1;

	if (not parse_number(get(kBIso), a.b_factor))
		a.b_factor = 0;

	if (not is_null(get(kTypeSymbol)))
		a.element = get(kTypeSymbol);

	if (not parse_number(get(kFormalCharge), a.charge))
		a.charge = 0;

	m_builder.add_atom(chain_id, nr, get(kAuthCompID, kLabelCompID), std::move(a));
}

} // namespace

// --------------------------------------------------------------------

void read_mmcif(std::string_view text, structure_builder &builder, std::error_code &ec)
{
	atom_site_parser parser(text, builder);
	parser.parse();

	if (parser.get_error())
		ec = parser.get_error();
}

} // namespace abag
