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

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

/**
 * @file gzip.hpp
 *
 * Reading of local files that may or may not be gzip compressed. Entries
 * placed in the raw directory by hand are often kept as .pdb.gz or .cif.gz
 * files, these are decompressed transparently.
 */

namespace abag
{

/// \brief Return true if @a data starts with the gzip magic bytes
bool is_gzip(std::string_view data);

/**
 * @brief Decompress the gzip compressed @a data. Multiple concatenated
 * gzip members are supported. Sets @a ec to errc::io_failure if the data
 * is not valid gzip.
 */
std::string gunzip(std::string_view data, std::error_code &ec);

/**
 * @brief Read the file @a file into memory, decompressing it if it is
 * gzip compressed. Sets @a ec to errc::io_failure on failure.
 */
std::string read_file(const std::filesystem::path &file, std::error_code &ec);

} // namespace abag
