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

#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

/**
 * @file model.hpp
 *
 * The in-memory model of a parsed structure. This is a format independent
 * representation: a structure is an ordered list of chains, a chain an
 * ordered list of residues and a residue a list of atoms.
 *
 * Residue numbers are stored exactly as they were found in the input,
 * there is no renumbering anywhere in this library.
 */

namespace abag
{

// --------------------------------------------------------------------

/// \brief The raw file formats the archive provides
enum class structure_format
{
	pdb,  ///< The legacy fixed column PDB format
	mmcif ///< The modern tagged mmCIF format
};

/// \brief The file extension used for @a format, without a leading dot
std::string_view get_extension(structure_format format);

/// \brief Human readable name for @a format
std::string_view to_string(structure_format format);

// --------------------------------------------------------------------

/**
 * @brief Normalise an archive identifier: trim and convert to upper case.
 *
 * Sets @a ec to errc::invalid_identifier when the result is not exactly
 * four ASCII letters or digits.
 */
std::string normalize_identifier(std::string_view id, std::error_code &ec);

/// \brief Throwing version of normalize_identifier
std::string normalize_identifier(std::string_view id);

// --------------------------------------------------------------------

/**
 * @brief A residue number as used in PDB files, an integer sequence
 * number with an optional single character insertion code.
 */
class residue_number
{
  public:
	residue_number() = default;

	residue_number(int seq_id, char ins_code = 0)
		: m_seq_id(seq_id)
		, m_ins_code(ins_code == ' ' ? 0 : ins_code)
	{
	}

	int get_seq_id() const { return m_seq_id; }        ///< Return the sequence number
	char get_ins_code() const { return m_ins_code; }   ///< Return the insertion code, 0 if there is none
	bool has_ins_code() const { return m_ins_code != 0; }

	/// \brief Return the textual form, e.g. "2A" or "-3"
	std::string str() const;

	bool operator==(const residue_number &rhs) const
	{
		return m_seq_id == rhs.m_seq_id and m_ins_code == rhs.m_ins_code;
	}

	bool operator!=(const residue_number &rhs) const
	{
		return not operator==(rhs);
	}

	/**
	 * @brief Parse a token like "12", "-3" or "52A".
	 *
	 * Sets @a ec to errc::malformed_residue_numbering if the token is not
	 * an integer optionally followed by one insertion code character.
	 */
	static residue_number parse(std::string_view token, std::error_code &ec);

	/**
	 * @brief Parse a sequence number and a separate insertion code, as
	 * found in mmCIF files. The values '?' and '.' for @a ins_code mean
	 * there is no insertion code.
	 */
	static residue_number parse(std::string_view seq_id, std::string_view ins_code, std::error_code &ec);

  private:
	int m_seq_id = 0;
	char m_ins_code = 0;
};

// --------------------------------------------------------------------

/**
 * @brief The fields of one atom record. These are carried through from
 * input to output unchanged, except for the serial number which is
 * reassigned when writing.
 */
struct atom
{
	bool hetero = false;      ///< HETATM rather than ATOM
	int serial = 0;
	std::string name;         ///< atom name, without padding
	std::string alt_id;       ///< alternate location indicator, may be empty
	float x = 0, y = 0, z = 0;
	float occupancy = 1;
	float b_factor = 0;
	std::string element;
	int charge = 0;
};

// --------------------------------------------------------------------

/**
 * @brief A residue, identified within its chain by its residue_number.
 */
class residue
{
  public:
	residue(residue_number nr, std::string compound_id)
		: m_number(nr)
		, m_compound_id(std::move(compound_id))
	{
	}

	const residue_number &get_number() const { return m_number; }    ///< Return the residue number
	const std::string &get_compound_id() const { return m_compound_id; } ///< Return the residue name, e.g. "ALA"

	const std::vector<atom> &atoms() const { return m_atoms; }
	void add_atom(atom a) { m_atoms.emplace_back(std::move(a)); }

	/// \brief Return true if this is a water molecule
	bool is_water() const;

	/// \brief Return true if all atoms of this residue are HETATM records
	bool is_hetero() const;

  private:
	residue_number m_number;
	std::string m_compound_id;
	std::vector<atom> m_atoms;
};

// --------------------------------------------------------------------

/**
 * @brief A chain is an ordered list of residues with a chain identifier,
 * the auth_asym_id in mmCIF speak.
 */
class chain : public std::vector<residue>
{
  public:
	explicit chain(std::string id)
		: m_id(std::move(id))
	{
	}

	const std::string &get_id() const { return m_id; } ///< Return the chain identifier

	/// \brief Return the number of residues in this chain
	size_t get_residue_count() const { return size(); }

	/// \brief Return the number of atoms in all residues in this chain
	size_t get_atom_count() const;

  private:
	std::string m_id;
};

// --------------------------------------------------------------------

/**
 * @brief A parsed structure: an identifier, an ordered list of chains and
 * the format the data was parsed from.
 *
 * Chain identifiers are unique within a structure.
 */
class structure
{
  public:
	structure() = default;

	structure(std::string id, structure_format format)
		: m_id(std::move(id))
		, m_format(format)
	{
	}

	const std::string &get_id() const { return m_id; }
	structure_format get_format() const { return m_format; }

	const std::vector<chain> &chains() const { return m_chains; }

	bool empty() const { return m_chains.empty(); }

	/// \brief Return the chain with identifier @a id or nullptr if it does not exist
	const chain *get_chain(std::string_view id) const;

	/// \brief Return true if a chain with identifier @a id exists
	bool has_chain(std::string_view id) const { return get_chain(id) != nullptr; }

	/// \brief Append chain @a c, its identifier must not exist yet
	void add_chain(chain c);

	/// \brief Total number of residues over all chains
	size_t get_residue_count() const;

  private:
	std::string m_id;
	structure_format m_format = structure_format::pdb;
	std::vector<chain> m_chains;
};

// --------------------------------------------------------------------

/// \brief Short summary of a chain, used for listing the contents of an entry
struct chain_summary
{
	std::string id;
	size_t residue_count;

	bool operator==(const chain_summary &rhs) const
	{
		return id == rhs.id and residue_count == rhs.residue_count;
	}
};

/// \brief Return the chain summaries for the chains in @a s, in structure order
std::vector<chain_summary> summarize_chains(const structure &s);

} // namespace abag
