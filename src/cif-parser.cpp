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

#include "abag/cif-parser.hpp"
#include "abag/text.hpp"
#include "abag/utilities.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace abag
{

// --------------------------------------------------------------------

sac_parser::sac_parser(std::string_view text)
	: m_text(text)
{
	m_lookahead = get_next_token();
}

void sac_parser::error(std::error_code ec, const std::string &msg)
{
	if (m_ec)
		return;

	if (VERBOSE > 0)
		std::cerr << "Error parsing mmCIF at line " << m_line_nr << ": " << msg << '\n';

	m_ec = ec;
	m_pos = m_text.length();
	m_lookahead = CIFToken::END_OF_FILE;
}

sac_parser::CIFToken sac_parser::get_next_token()
{
	CIFToken result = CIFToken::END_OF_FILE;
	m_token_value = {};

	const auto kLength = m_text.length();

	// skip white space and comments
	while (not m_ec and m_pos < kLength)
	{
		char ch = m_text[m_pos];

		if (ch == '\n')
		{
			++m_line_nr;
			m_bol = true;
		}
		else if (ch == '#')
		{
			while (m_pos < kLength and m_text[m_pos] != '\n')
				++m_pos;
			continue;
		}
		else if (ch == '\r')
			;
		else if (is_space(ch))
			m_bol = false;
		else
			break;

		++m_pos;
	}

	if (m_ec or m_pos >= kLength)
		return result;

	char ch = m_text[m_pos];

	if (ch == ';' and m_bol)
	{
		// text field, ends at the first line starting with a semicolon
		auto start = m_pos + 1;
		auto end = m_text.find("\n;", start);
		if (end == std::string_view::npos)
		{
			error("unterminated textfield");
			return CIFToken::END_OF_FILE;
		}

		m_line_nr += static_cast<uint32_t>(std::count(m_text.begin() + start, m_text.begin() + end + 1, '\n'));

		m_token_value = m_text.substr(start, end - start);
		if (not m_token_value.empty() and m_token_value.back() == '\r')
			m_token_value.remove_suffix(1);

		m_pos = end + 2;
		result = CIFToken::VALUE;
	}
	else if (ch == '\'' or ch == '"')
	{
		// a quoted string ends at a matching quote followed by white space
		auto start = m_pos + 1;
		auto end = start;

		for (;;)
		{
			if (end >= kLength or m_text[end] == '\n' or m_text[end] == '\r')
			{
				error("unterminated quoted string");
				return CIFToken::END_OF_FILE;
			}

			if (m_text[end] == ch and (end + 1 == kLength or is_white(m_text[end + 1])))
				break;

			++end;
		}

		m_token_value = m_text.substr(start, end - start);
		m_pos = end + 1;
		result = CIFToken::VALUE;
	}
	else
	{
		auto start = m_pos;
		while (m_pos < kLength and is_non_blank(m_text[m_pos]))
			++m_pos;

		if (m_pos == start)
		{
			error("invalid character in input (" + std::to_string(static_cast<unsigned char>(ch)) + ")");
			return CIFToken::END_OF_FILE;
		}

		std::string_view token = m_text.substr(start, m_pos - start);

		if (ch == '_')
		{
			m_token_value = token;
			result = CIFToken::ITEM_NAME;
		}
		else if (token.length() >= 5 and iequals(token.substr(0, 5), "data_"))
		{
			m_token_value = token.substr(5);
			result = CIFToken::DATA;
		}
		else if (token.length() >= 5 and iequals(token.substr(0, 5), "save_"))
		{
			m_token_value = token.substr(5);
			result = m_token_value.empty() ? CIFToken::SAVE_ : CIFToken::SAVE_NAME;
		}
		else if (iequals(token, "loop_"))
			result = CIFToken::LOOP;
		else if (iequals(token, "global_"))
			result = CIFToken::GLOBAL;
		else if (iequals(token, "stop_"))
			result = CIFToken::STOP;
		else
		{
			m_token_value = token;
			result = CIFToken::VALUE;
		}
	}

	m_bol = false;

	return result;
}

void sac_parser::match(CIFToken token)
{
	if (m_lookahead != token)
		error(std::string("Unexpected token, expected ") + get_token_name(token) + " but found " + get_token_name(m_lookahead));
	else
		m_lookahead = get_next_token();
}

// --------------------------------------------------------------------

void sac_parser::parse_first_datablock()
{
	while (m_lookahead == CIFToken::GLOBAL)
		parse_global();

	if (m_lookahead != CIFToken::DATA)
	{
		error("This file does not seem to be an mmCIF file");
		return;
	}

	produce_datablock(m_token_value);
	match(CIFToken::DATA);

	parse_datablock();

	switch (m_lookahead)
	{
		case CIFToken::END_OF_FILE:
		case CIFToken::DATA:
		case CIFToken::GLOBAL:
			break;

		default:
			error(std::string("Unexpected token ") + get_token_name(m_lookahead) + " in data block");
			break;
	}
}

void sac_parser::parse_global()
{
	match(CIFToken::GLOBAL);
	while (m_lookahead == CIFToken::ITEM_NAME)
	{
		match(CIFToken::ITEM_NAME);
		match(CIFToken::VALUE);
	}
}

void sac_parser::parse_datablock()
{
	static const std::string kUnitializedCategory("<invalid>");
	std::string cat = kUnitializedCategory; // intial value acts as a guard for empty category names

	auto split_name = [this](std::string_view name, std::string &cat_name, std::string &item_name)
	{
		auto dot = name.find('.');
		if (dot == std::string_view::npos or dot < 2)
		{
			error("item name " + std::string{ name } + " is not of the form _category.item");
			return false;
		}

		cat_name.assign(name.substr(1, dot - 1));
		item_name.assign(name.substr(dot + 1));
		return true;
	};

	while (m_lookahead == CIFToken::LOOP or m_lookahead == CIFToken::ITEM_NAME or m_lookahead == CIFToken::SAVE_NAME)
	{
		switch (m_lookahead)
		{
			case CIFToken::LOOP:
			{
				cat = kUnitializedCategory; // should start a new category

				match(CIFToken::LOOP);

				std::vector<std::string> item_names;

				while (m_lookahead == CIFToken::ITEM_NAME)
				{
					std::string cat_name, item_name;
					if (not split_name(m_token_value, cat_name, item_name))
						break;

					if (cat == kUnitializedCategory)
					{
						produce_category(cat_name);
						cat = cat_name;
					}
					else if (not iequals(cat, cat_name))
						error("inconsistent categories in loop_");

					item_names.push_back(item_name);

					match(CIFToken::ITEM_NAME);
				}

				if (item_names.empty())
					error("loop_ without item names");

				while (m_lookahead == CIFToken::VALUE)
				{
					produce_row();

					for (auto &item_name : item_names)
					{
						if (m_lookahead != CIFToken::VALUE)
						{
							error("number of values in loop_ for " + cat + " is not a multiple of the number of items");
							break;
						}

						produce_item(cat, item_name, m_token_value);
						match(CIFToken::VALUE);
					}
				}

				cat.clear();
				break;
			}

			case CIFToken::ITEM_NAME:
			{
				std::string cat_name, item_name;
				if (not split_name(m_token_value, cat_name, item_name))
					break;

				if (not iequals(cat, cat_name))
				{
					produce_category(cat_name);
					cat = cat_name;
					produce_row();
				}

				match(CIFToken::ITEM_NAME);

				if (m_lookahead == CIFToken::VALUE)
					produce_item(cat, item_name, m_token_value);

				match(CIFToken::VALUE);
				break;
			}

			case CIFToken::SAVE_NAME:
				error("A regular CIF file should not contain a save frame");
				break;

			default:
				break;
		}
	}
}

} // namespace abag
