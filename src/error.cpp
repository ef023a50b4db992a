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

#include "abag/error.hpp"

#include <array>
#include <utility>

namespace abag
{

namespace
{
	const std::array<std::pair<errc, const char *>, 11> kReasonNames{ {
		{ errc::invalid_identifier, "invalid_identifier" },
		{ errc::invalid_chain_assignment, "invalid_chain_assignment" },
		{ errc::not_found, "not_found" },
		{ errc::network_failure, "network_failure" },
		{ errc::timeout, "timeout" },
		{ errc::unavailable, "unavailable" },
		{ errc::malformed_residue_numbering, "malformed_residue_numbering" },
		{ errc::empty_structure, "empty" },
		{ errc::syntax_error, "syntax_error" },
		{ errc::chain_not_found, "chain_not_found" },
		{ errc::io_failure, "io_failure" },
	} };
} // namespace

std::string reason_name(std::error_code ec)
{
	if (not ec)
		return {};

	if (ec.category() == abag_category())
	{
		for (const auto &[code, name] : kReasonNames)
		{
			if (static_cast<int>(code) == ec.value())
				return name;
		}
	}

	// errors from other categories, e.g. std::filesystem
	return std::string(ec.category().name()) + ':' + std::to_string(ec.value());
}

std::error_code reason_from_name(std::string_view name)
{
	for (const auto &[code, n] : kReasonNames)
	{
		if (name == n)
			return make_error_code(code);
	}

	return {};
}

} // namespace abag
