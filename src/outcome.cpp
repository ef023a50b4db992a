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

#include "abag/outcome.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace abag
{

namespace
{

const std::pair<status, const char *> kStatusNames[] = {
	{ status::success, "success" },
	{ status::download_failed, "download_failed" },
	{ status::parse_failed, "parse_failed" },
	{ status::chain_not_found, "chain_not_found" },
	{ status::write_failed, "write_failed" }
};

} // namespace

std::string_view to_string(status s)
{
	for (auto &[st, name] : kStatusNames)
	{
		if (st == s)
			return name;
	}

	return "unknown";
}

std::optional<status> status_from_string(std::string_view name)
{
	std::optional<status> result;

	for (auto &[st, n] : kStatusNames)
	{
		if (name == n)
		{
			result = st;
			break;
		}
	}

	return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point t)
{
	auto tt = std::chrono::system_clock::to_time_t(t);

	std::tm tm{};
	gmtime_r(&tt, &tm);

	std::ostringstream s;
	s << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
	return s.str();
}

} // namespace abag
