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

#include "abag/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

/**
 * @file cif-parser.hpp
 *
 * This file contains the declaration of a small mmCIF parser, enough to
 * extract the atom records from the first data block of a file.
 */

namespace abag
{

// --------------------------------------------------------------------

/**
 * @brief The sac_parser is similar to SAX parsers (Simple API for XML,
 * in our case it is Simple API for CIF)
 *
 * The parser works on text that is fully in memory, it reports the
 * contents of the first data block in the text through the produce_
 * methods. Derived classes should implement these.
 *
 * Errors do not throw, the first error is recorded and parsing stops.
 * Use get_error() to see whether parsing succeeded.
 */

class sac_parser
{
  public:
	/** @cond */
	virtual ~sac_parser() = default;
	/** @endcond */

	/// \brief Return true if the character @a ch is a *space* character
	static constexpr bool is_space(int ch)
	{
		return ch == ' ' or ch == '\t' or ch == '\r' or ch == '\n';
	}

	/// \brief Return true if the character @a ch is a *white* character
	static constexpr bool is_white(int ch)
	{
		return is_space(ch) or ch == '#';
	}

	/// \brief Return true if the character @a ch is a *non_blank* character
	static constexpr bool is_non_blank(int ch)
	{
		return ch > 0x20 and ch < 0x7f;
	}

	/**
	 * @brief Parse the first data block in the text. Anything following
	 * the next data_ line is not examined.
	 */
	void parse_first_datablock();

	/// \brief The line number the parser is currently at
	uint32_t get_line_nr() const { return m_line_nr; }

	/// \brief Return the first error encountered, if any
	std::error_code get_error() const { return m_ec; }

  protected:
	/** @cond */

	enum class CIFToken
	{
		END_OF_FILE,

		DATA,
		LOOP,
		GLOBAL,
		SAVE_,
		SAVE_NAME,
		STOP,
		ITEM_NAME,
		VALUE
	};

	static constexpr const char *get_token_name(CIFToken token)
	{
		switch (token)
		{
			case CIFToken::END_OF_FILE: return "Eof";
			case CIFToken::DATA: return "DATA";
			case CIFToken::LOOP: return "LOOP";
			case CIFToken::GLOBAL: return "GLOBAL";
			case CIFToken::SAVE_: return "SAVE";
			case CIFToken::SAVE_NAME: return "SAVE+name";
			case CIFToken::STOP: return "STOP";
			case CIFToken::ITEM_NAME: return "Tag";
			case CIFToken::VALUE: return "Value";
			default: return "Invalid token parameter";
		}
	}

	sac_parser(std::string_view text);

	CIFToken get_next_token();

	void match(CIFToken token);

	void parse_global();

	void parse_datablock();

	/// \brief Record error @a ec with message @a msg, parsing stops after this
	void error(std::error_code ec, const std::string &msg);

	void error(const std::string &msg)
	{
		error(make_error_code(errc::syntax_error), msg);
	}

	// production methods, these are pure virtual here

	virtual void produce_datablock(std::string_view name) = 0;
	virtual void produce_category(std::string_view name) = 0;
	virtual void produce_row() = 0;
	virtual void produce_item(std::string_view category, std::string_view item, std::string_view value) = 0;

  private:

	std::string_view m_text;
	std::string_view::size_type m_pos = 0;

	// Parser state
	uint32_t m_line_nr = 1;
	bool m_bol = true;
	CIFToken m_lookahead = CIFToken::END_OF_FILE;
	std::error_code m_ec;

  protected:
	std::string_view m_token_value;

	/** @endcond */
};

} // namespace abag
