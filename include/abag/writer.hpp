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

#include "abag/model.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

/**
 * @file writer.hpp
 *
 * Writing structures in the legacy PDB format. Only the coordinate
 * section is written: ATOM and HETATM records, a TER record after each
 * chain and an END record.
 */

namespace abag
{

/**
 * @brief Write the structure @a s to @a os in PDB format.
 *
 * Atom serial numbers are assigned sequentially starting at 1, TER records
 * take a serial number as well. Residue numbers and insertion codes are
 * written as they are stored.
 *
 * If a chain has an identifier that does not fit in the single character
 * PDB chain column @a ec is set to errc::io_failure and nothing is written.
 */
void write(std::ostream &os, const structure &s, std::error_code &ec);

/**
 * @brief Write the structure @a s to the file @a file in PDB format.
 *
 * The data is first written to a temporary file in the same directory
 * which is then moved into place. Sets @a ec to errc::io_failure on
 * failure, in which case @a file is not touched.
 */
void write(const std::filesystem::path &file, const structure &s, std::error_code &ec);

} // namespace abag
