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

#include "abag/gzip.hpp"
#include "abag/error.hpp"
#include "abag/utilities.hpp"

#include <fstream>
#include <iterator>
#include <memory>

#include <zlib.h>

namespace fs = std::filesystem;

namespace abag
{

bool is_gzip(std::string_view data)
{
	return data.length() >= 2 and
	       static_cast<unsigned char>(data[0]) == 0x1f and
	       static_cast<unsigned char>(data[1]) == 0x8b;
}

std::string gunzip(std::string_view data, std::error_code &ec)
{
	const size_t kBufferSize = 256 * 1024;

	std::string result;

	z_stream_s zstream{};
	zstream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
	zstream.avail_in = static_cast<uInt>(data.length());

	// 47 is MAX_WBITS + 32: detect gzip or zlib headers automatically
	int err = ::inflateInit2(&zstream, 47);

	std::unique_ptr<char[]> buffer(new char[kBufferSize]);

	while (err == Z_OK)
	{
		zstream.next_out = reinterpret_cast<Bytef *>(buffer.get());
		zstream.avail_out = kBufferSize;

		err = ::inflate(&zstream, Z_NO_FLUSH);

		result.append(buffer.get(), kBufferSize - zstream.avail_out);

		// a gzip file may consist of several members
		if (err == Z_STREAM_END and zstream.avail_in > 0)
			err = ::inflateReset2(&zstream, 47);
		else if (err == Z_BUF_ERROR and zstream.avail_in == 0)
			break;
	}

	::inflateEnd(&zstream);

	if (err != Z_STREAM_END)
	{
		if (VERBOSE > 0)
			std::cerr << "Error decompressing data: " << (zstream.msg ? zstream.msg : "truncated input") << '\n';

		ec = make_error_code(errc::io_failure);
		result.clear();
	}

	return result;
}

std::string read_file(const fs::path &file, std::error_code &ec)
{
	std::string result;

	std::ifstream in(file, std::ios::binary);
	if (not in.is_open())
	{
		if (VERBOSE > 0)
			std::cerr << "Could not open file " << file << '\n';
		ec = make_error_code(errc::io_failure);
		return result;
	}

	result.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());

	if (in.bad())
	{
		ec = make_error_code(errc::io_failure);
		result.clear();
	}
	else if (is_gzip(result))
		result = gunzip(result, ec);

	return result;
}

} // namespace abag
