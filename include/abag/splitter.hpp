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

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

/**
 * @file splitter.hpp
 *
 * Chain assignments and the splitting of a structure into an antigen part
 * and an antibody part.
 */

namespace abag
{

// --------------------------------------------------------------------

/**
 * @brief Parse a list of chain identifiers as found in a reference row,
 * e.g. "A | B" or "A,B". Identifiers are trimmed and converted to upper
 * case, empty fields and the literal NA are skipped. Duplicates are
 * removed, the first occurrence is kept.
 */
std::vector<std::string> parse_chain_ids(std::string_view text);

/**
 * @brief Normalise a single chain identifier field. Returns an empty
 * optional for an empty field or the literal NA.
 */
std::optional<std::string> parse_chain_id(std::string_view text);

// --------------------------------------------------------------------

/**
 * @brief Which chains of a structure belong to the antigen and which to
 * the antibody.
 *
 * The antibody consists of a heavy and/or a light chain. Some entries,
 * nanobodies e.g., only have a heavy chain. When heavy and light chain
 * have the same identifier (single chain constructs) the antibody
 * consists of that single chain.
 *
 * A chain_assignment can only be created through one of the create
 * functions, which guarantee that:
 *
 * - the antigen has at least one chain
 * - the antibody has at least one chain
 * - no chain is part of both antigen and antibody
 * - chain identifiers consist of printable ASCII characters only
 */
class chain_assignment
{
  public:
	chain_assignment() = default;

	/**
	 * @brief Create an assignment from already normalised parts. Sets
	 * @a ec to errc::invalid_chain_assignment if the parts do not form a
	 * valid assignment.
	 */
	static chain_assignment create(std::vector<std::string> antigen,
		std::optional<std::string> heavy, std::optional<std::string> light,
		std::error_code &ec);

	/**
	 * @brief Create an assignment from two lists of chain identifiers, the
	 * first antibody chain is taken to be the heavy chain, the second the
	 * light chain. More than two antibody chains is an error.
	 */
	static chain_assignment create(const std::vector<std::string> &antigen,
		const std::vector<std::string> &antibody, std::error_code &ec);

	/// \brief Version of create that throws std::system_error
	static chain_assignment create(const std::vector<std::string> &antigen,
		const std::vector<std::string> &antibody);

	const std::vector<std::string> &get_antigen_chains() const { return m_antigen; }
	const std::optional<std::string> &get_heavy_chain() const { return m_heavy; }
	const std::optional<std::string> &get_light_chain() const { return m_light; }

	/// \brief Heavy followed by light chain, without duplicates
	std::vector<std::string> get_antibody_chains() const;

	/// \brief Return a short description, like "A|B vs H,L"
	std::string str() const;

	bool empty() const { return m_antigen.empty(); }

	bool operator==(const chain_assignment &rhs) const
	{
		return m_antigen == rhs.m_antigen and m_heavy == rhs.m_heavy and m_light == rhs.m_light;
	}

	bool operator!=(const chain_assignment &rhs) const
	{
		return not operator==(rhs);
	}

  private:
	std::vector<std::string> m_antigen;
	std::optional<std::string> m_heavy, m_light;
};

// --------------------------------------------------------------------

/// \brief The result of splitting a structure
struct split_result
{
	structure antigen;                ///< The antigen chains, in requested order
	structure antibody;               ///< The antibody chains, in requested order
	std::vector<std::string> missing; ///< Requested chains that were not found
};

/**
 * @brief Split @a s into antigen and antibody according to @a assignment.
 *
 * If any of the requested chains is not present in @a s, @a ec is set to
 * errc::chain_not_found and the returned result only contains the list
 * of missing chains, antigen chains first. Residues are copied as is,
 * numbering and insertion codes are never changed.
 */
split_result split(const structure &s, const chain_assignment &assignment, std::error_code &ec);

} // namespace abag
