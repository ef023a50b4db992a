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

/**
 * @file error.hpp
 *
 * The error codes reported by the stages of the pipeline. Each stage
 * reports failure through a std::error_code in this category, the entry
 * processor maps these onto the status of an outcome record.
 */

namespace abag
{

/**
 * @enum errc
 *
 * @brief A strongly typed class containing the error codes reported by the fetch, parse, split and write stages
 */
enum class errc
{
	invalid_identifier = 1,      /**< An archive identifier is not a 4 character alphanumeric code */
	invalid_chain_assignment,    /**< Antigen and antibody chains overlap, or one side is empty */
	not_found,                   /**< The archive answered, but not with a 2xx status */
	network_failure,             /**< The archive could not be reached */
	timeout,                     /**< The request to the archive timed out */
	unavailable,                 /**< The entry could not be retrieved in any supported format */
	malformed_residue_numbering, /**< A residue number is not an integer with an optional insertion code */
	empty_structure,             /**< The file contains no atom records */
	syntax_error,                /**< The file could not be tokenised */
	chain_not_found,             /**< One or more requested chains are not present in the structure */
	io_failure,                  /**< Reading or writing a local file failed */
};

/**
 * @brief The implementation for @ref abag_category error messages
 */
class abag_category_impl : public std::error_category
{
  public:
	const char *name() const noexcept override
	{
		return "abag";
	}

	std::string message(int ev) const override
	{
		switch (static_cast<errc>(ev))
		{
			case errc::invalid_identifier:
				return "Invalid archive identifier";
			case errc::invalid_chain_assignment:
				return "Invalid chain assignment";
			case errc::not_found:
				return "File not found in archive";
			case errc::network_failure:
				return "Network failure";
			case errc::timeout:
				return "Request timed out";
			case errc::unavailable:
				return "Entry unavailable in any supported format";
			case errc::malformed_residue_numbering:
				return "Malformed residue numbering";
			case errc::empty_structure:
				return "No atom records found";
			case errc::syntax_error:
				return "Syntax error in structure file";
			case errc::chain_not_found:
				return "Chain not found";
			case errc::io_failure:
				return "I/O failure";
			default:
				return "unknown error code";
		}
	}

	bool equivalent(const std::error_code & /*code*/, int /*condition*/) const noexcept override
	{
		return false;
	}
};

/**
 * @brief Return the single instance of the abag error category
 */
inline std::error_category &abag_category()
{
	static abag_category_impl instance;
	return instance;
}

inline std::error_code make_error_code(errc e)
{
	return std::error_code(static_cast<int>(e), abag_category());
}

inline std::error_condition make_error_condition(errc e)
{
	return std::error_condition(static_cast<int>(e), abag_category());
}

/// \brief The short name of an error, used as key in the failure breakdown
/// and stored in the failure ledger.
std::string reason_name(std::error_code ec);

/// \brief The reverse of reason_name, returns an empty error_code for unknown names
std::error_code reason_from_name(std::string_view name);

} // namespace abag

namespace std
{

template <>
struct is_error_code_enum<abag::errc> : public true_type
{
};

} // namespace std
