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

#include "abag/splitter.hpp"
#include "abag/error.hpp"
#include "abag/text.hpp"
#include "abag/utilities.hpp"

#include <algorithm>
#include <iostream>

namespace abag
{

namespace
{

// chain identifiers are printable ASCII without spaces
bool is_valid_chain_id(const std::string &id)
{
	return not id.empty() and std::all_of(id.begin(), id.end(), [](char ch)
		{ return ch > ' ' and ch < 127; });
}

} // namespace

// --------------------------------------------------------------------

std::optional<std::string> parse_chain_id(std::string_view text)
{
	std::optional<std::string> result;

	auto id = trim_copy(text);
	to_upper(id);

	if (not id.empty() and id != "NA")
		result = id;

	return result;
}

std::vector<std::string> parse_chain_ids(std::string_view text)
{
	std::vector<std::string> result;

	for (auto field : split<std::string_view>(text, "|,", true))
	{
		auto id = parse_chain_id(field);
		if (id and std::find(result.begin(), result.end(), *id) == result.end())
			result.push_back(*id);
	}

	return result;
}

// --------------------------------------------------------------------

chain_assignment chain_assignment::create(std::vector<std::string> antigen,
	std::optional<std::string> heavy, std::optional<std::string> light, std::error_code &ec)
{
	chain_assignment result;

	result.m_antigen = std::move(antigen);
	result.m_heavy = std::move(heavy);
	result.m_light = std::move(light);

	auto antibody = result.get_antibody_chains();

	bool valid = not result.m_antigen.empty() and not antibody.empty();

	for (auto &id : antibody)
	{
		if (not is_valid_chain_id(id))
			valid = false;
	}

	for (auto &id : result.m_antigen)
	{
		if (not is_valid_chain_id(id) or std::count(result.m_antigen.begin(), result.m_antigen.end(), id) > 1)
			valid = false;
		else if (std::find(antibody.begin(), antibody.end(), id) != antibody.end())
		{
			if (VERBOSE > 0)
				std::cerr << "Chain " << id << " is assigned to both antigen and antibody\n";
			valid = false;
		}
	}

	if (not valid)
	{
		ec = make_error_code(errc::invalid_chain_assignment);
		result = {};
	}

	return result;
}

chain_assignment chain_assignment::create(const std::vector<std::string> &antigen,
	const std::vector<std::string> &antibody, std::error_code &ec)
{
	std::vector<std::string> ag;
	for (auto &id : antigen)
	{
		auto c = parse_chain_id(id);
		if (c and std::find(ag.begin(), ag.end(), *c) == ag.end())
			ag.push_back(*c);
	}

	std::vector<std::string> ab;
	for (auto &id : antibody)
	{
		if (auto c = parse_chain_id(id); c)
			ab.push_back(*c);
	}

	if (ab.size() > 2)
	{
		if (VERBOSE > 0)
			std::cerr << "An antibody consists of at most a heavy and a light chain, got " << ab.size() << " chains\n";
		ec = make_error_code(errc::invalid_chain_assignment);
		return {};
	}

	std::optional<std::string> heavy, light;
	if (ab.size() > 0)
		heavy = ab[0];
	if (ab.size() > 1)
		light = ab[1];

	return create(std::move(ag), std::move(heavy), std::move(light), ec);
}

chain_assignment chain_assignment::create(const std::vector<std::string> &antigen,
	const std::vector<std::string> &antibody)
{
	std::error_code ec;
	auto result = create(antigen, antibody, ec);
	if (ec)
		throw std::system_error(ec, "antigen " + join(antigen, "|") + ", antibody " + join(antibody, ","));
	return result;
}

std::vector<std::string> chain_assignment::get_antibody_chains() const
{
	std::vector<std::string> result;

	if (m_heavy)
		result.push_back(*m_heavy);
	if (m_light and m_light != m_heavy)
		result.push_back(*m_light);

	return result;
}

std::string chain_assignment::str() const
{
	return join(m_antigen, "|") + " vs " + join(get_antibody_chains(), ",");
}

// --------------------------------------------------------------------

split_result split(const structure &s, const chain_assignment &assignment, std::error_code &ec)
{
	split_result result;

	for (auto &id : assignment.get_antigen_chains())
	{
		if (not s.has_chain(id))
			result.missing.push_back(id);
	}

	auto antibody_chains = assignment.get_antibody_chains();

	for (auto &id : antibody_chains)
	{
		if (not s.has_chain(id))
			result.missing.push_back(id);
	}

	if (not result.missing.empty())
	{
		if (VERBOSE > 0)
			std::cerr << "Chain(s) " << join(result.missing, ",") << " not found in " << s.get_id() << '\n';

		ec = make_error_code(errc::chain_not_found);
		return result;
	}

	result.antigen = structure(s.get_id(), s.get_format());
	for (auto &id : assignment.get_antigen_chains())
		result.antigen.add_chain(*s.get_chain(id));

	result.antibody = structure(s.get_id(), s.get_format());
	for (auto &id : antibody_chains)
		result.antibody.add_chain(*s.get_chain(id));

	return result;
}

} // namespace abag
