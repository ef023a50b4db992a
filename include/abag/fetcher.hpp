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

#include "abag/config.hpp"
#include "abag/model.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

/**
 * @file fetcher.hpp
 *
 * Retrieval of raw structure files from the archive, with a local cache
 * in the raw directory of the output layout.
 */

namespace abag
{

// --------------------------------------------------------------------

/**
 * @brief Abstract transport to the archive. The library uses the
 * curl_archive_client, tests can provide their own.
 *
 * Implementations must be usable from several threads at once.
 */
class archive_client
{
  public:
	virtual ~archive_client() = default;

	/**
	 * @brief Retrieve @a url and write the body to @a out.
	 *
	 * On failure @a ec is set to errc::not_found when the archive answered
	 * with a status other than 2xx, errc::timeout when the request timed
	 * out or errc::network_failure for all other problems.
	 */
	virtual void get(const std::string &url, std::ostream &out, std::error_code &ec) = 0;
};

/// \brief An archive_client using libcurl
class curl_archive_client : public archive_client
{
  public:
	explicit curl_archive_client(std::chrono::seconds timeout)
		: m_timeout(timeout)
	{
	}

	void get(const std::string &url, std::ostream &out, std::error_code &ec) override;

  private:
	std::chrono::seconds m_timeout;
};

// --------------------------------------------------------------------

/// \brief The result of a fetch
struct fetch_result
{
	std::filesystem::path path;                        ///< The raw file, empty on failure
	structure_format format = structure_format::pdb;   ///< The format of the raw file
	bool downloaded = false;                           ///< False if an existing file was used
	std::string detail;                                ///< What went wrong, for each attempt
};

/**
 * @brief Fetches raw files for entries, PDB format first and mmCIF if
 * that is not available.
 */
class source_fetcher
{
  public:
	source_fetcher(const config &cfg, archive_client &client);

	source_fetcher(const source_fetcher &) = delete;
	source_fetcher &operator=(const source_fetcher &) = delete;

	/**
	 * @brief Make sure the raw file for @a id is present in the raw
	 * directory of @a output_dir.
	 *
	 * If @a incremental is true and a raw file is already present, in
	 * either format and possibly gzip compressed, no request is made.
	 * Otherwise the file is downloaded, a partially downloaded file never
	 * appears under its final name.
	 *
	 * If neither format could be retrieved @a ec is set to
	 * errc::unavailable and the detail field of the result describes the
	 * cause for each attempt.
	 */
	fetch_result fetch(const std::string &id, const std::filesystem::path &output_dir, bool incremental, std::error_code &ec) const;

	/// \brief Return the raw file for @a id in @a raw_dir if there is one
	static std::optional<fetch_result> find_local(const std::filesystem::path &raw_dir, const std::string &id);

  private:
	void download(const std::string &url, const std::filesystem::path &dest, std::error_code &ec) const;

	std::string m_base_url;
	uint32_t m_attempts;
	std::chrono::milliseconds m_retry_delay;
	archive_client &m_client;
};

} // namespace abag
