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

#include <cstdio>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

/**  \file format.hpp
 *
 * A thin type safe-ish wrapper around snprintf. The legacy PDB format is
 * defined in terms of fortran style fixed columns, printf format strings
 * express those most naturally.
 */

namespace abag
{

namespace detail
{
	template <typename T>
	auto to_varg(const T &v)
	{
		static_assert(std::is_arithmetic_v<T> or std::is_pointer_v<T>, "unsupported argument type for format");
		return v;
	}

	inline const char *to_varg(const std::string &v)
	{
		return v.c_str();
	}

	inline const char *to_varg(const char *v)
	{
		return v;
	}

	template <typename... Args>
	std::string do_format(const char *fmt, const Args &...args)
	{
		char buffer[256];

		int n = std::snprintf(buffer, sizeof(buffer), fmt, args...);
		if (n < 0)
			return {};

		if (static_cast<size_t>(n) < sizeof(buffer))
			return { buffer, static_cast<size_t>(n) };

		std::string result(n + 1, 0);
		std::snprintf(result.data(), result.size(), fmt, args...);
		result.resize(n);
		return result;
	}
} // namespace detail

/**
 * @brief Format the arguments in @a args into the C style format string
 * @a fmt, returns the result as a std::string
 *
 * @code {.cpp}
 * os << abag::format("TER   %5d      %3.3s %1.1s%4d%1.1s", serial, res_name, chain_id, seq, icode) << '\n';
 * @endcode
 */
template <typename... Args>
std::string format(const std::string &fmt, const Args &...args)
{
	return detail::do_format(fmt.c_str(), detail::to_varg(args)...);
}

} // namespace abag
