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

#include "abag/text.hpp"

#include <algorithm>

namespace abag
{

// --------------------------------------------------------------------

namespace
{
	inline char ascii_upper(char ch)
	{
		return (ch >= 'a' and ch <= 'z') ? static_cast<char>(ch - ('a' - 'A')) : ch;
	}

	inline bool is_blank(char ch)
	{
		return ch == ' ' or ch == '\t' or ch == '\r' or ch == '\n' or ch == '\f' or ch == '\v';
	}
} // namespace

bool iequals(std::string_view a, std::string_view b)
{
	bool result = a.length() == b.length();
	for (auto ai = a.begin(), bi = b.begin(); result and ai != a.end(); ++ai, ++bi)
		result = ascii_upper(*ai) == ascii_upper(*bi);
	return result;
}

void to_upper(std::string &s)
{
	for (auto &c : s)
		c = ascii_upper(c);
}

void trim(std::string &s)
{
	auto e = std::find_if_not(s.rbegin(), s.rend(), is_blank).base();
	s.erase(e, s.end());

	auto b = std::find_if_not(s.begin(), s.end(), is_blank);
	s.erase(s.begin(), b);
}

std::string trim_copy(std::string_view s)
{
	std::string result(s);
	trim(result);
	return result;
}

} // namespace abag
