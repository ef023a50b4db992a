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

#include "abag/fetcher.hpp"
#include "abag/error.hpp"
#include "abag/text.hpp"
#include "abag/utilities.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <thread>
#include <vector>

#include <curl/curl.h>

namespace fs = std::filesystem;

namespace abag
{

namespace
{

// curl_global_init is not thread safe, run it once before any transfer
struct curl_global
{
	curl_global()
	{
		m_rc = curl_global_init(CURL_GLOBAL_DEFAULT);
	}

	~curl_global()
	{
		if (m_rc == CURLE_OK)
			curl_global_cleanup();
	}

	CURLcode m_rc;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
	auto &out = *static_cast<std::ostream *>(userdata);
	out.write(ptr, size * nmemb);

	// returning less than was offered makes curl abort with CURLE_WRITE_ERROR
	return out ? size * nmemb : 0;
}

} // namespace

// --------------------------------------------------------------------

void curl_archive_client::get(const std::string &url, std::ostream &out, std::error_code &ec)
{
	static curl_global s_curl_global;

	if (s_curl_global.m_rc != CURLE_OK)
	{
		if (VERBOSE > 0)
			std::cerr << "Could not initialise libcurl: " << curl_easy_strerror(s_curl_global.m_rc) << '\n';
		ec = make_error_code(errc::network_failure);
		return;
	}

	std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
	if (not curl)
	{
		ec = make_error_code(errc::network_failure);
		return;
	}

	const std::string user_agent = "libabag/" + get_version_nr();

	curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);
	curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(m_timeout.count()));
	curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");

	CURLcode res = curl_easy_perform(curl.get());

	long status = 0;
	curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

	switch (res)
	{
		case CURLE_OK:
			if (status != 0 and (status < 200 or status >= 300))
				ec = make_error_code(errc::not_found);
			break;

		case CURLE_HTTP_RETURNED_ERROR:
			ec = make_error_code(errc::not_found);
			break;

		case CURLE_OPERATION_TIMEDOUT:
			ec = make_error_code(errc::timeout);
			break;

		default:
			ec = make_error_code(errc::network_failure);
			break;
	}

	if (ec and VERBOSE > 1)
	{
		std::cerr << "Request for " << url << " failed: " << curl_easy_strerror(res);
		if (status != 0)
			std::cerr << " (HTTP status " << status << ')';
		std::cerr << '\n';
	}
}

// --------------------------------------------------------------------

source_fetcher::source_fetcher(const config &cfg, archive_client &client)
	: m_base_url(cfg.archive_url)
	, m_attempts(cfg.download_attempts > 0 ? cfg.download_attempts : 1)
	, m_retry_delay(cfg.retry_delay)
	, m_client(client)
{
	if (not m_base_url.empty() and m_base_url.back() != '/')
		m_base_url += '/';
}

std::optional<fetch_result> source_fetcher::find_local(const fs::path &raw_dir, const std::string &id)
{
	std::optional<fetch_result> result;

	// files placed by hand may have a lower case name, e.g. 1abc.pdb
	std::vector<fs::path> candidates;

	std::error_code ec;
	for (fs::directory_iterator i(raw_dir, ec), end; not ec and i != end; i.increment(ec))
	{
		auto name = i->path().filename().string();
		if (name.length() > id.length() and iequals(name.substr(0, id.length()), id) and name[id.length()] == '.')
			candidates.push_back(i->path());
	}

	// an exact, upper case, name sorts before its lower case variants
	std::sort(candidates.begin(), candidates.end());
	ec.clear();

	for (auto format : { structure_format::pdb, structure_format::mmcif })
	{
		auto name = id + '.' + std::string{ get_extension(format) };

		for (auto &wanted : { name, name + ".gz" })
		{
			for (auto &p : candidates)
			{
				if (not iequals(p.filename().string(), wanted))
					continue;

				if (fs::is_regular_file(p, ec) and fs::file_size(p, ec) > 0 and not ec)
				{
					result = fetch_result{ p, format, false, {} };
					return result;
				}

				ec.clear();
			}
		}
	}

	return result;
}

fetch_result source_fetcher::fetch(const std::string &id, const fs::path &output_dir, bool incremental, std::error_code &ec) const
{
	output_layout layout(output_dir);

	if (incremental)
	{
		auto local = find_local(layout.raw_dir, id);
		if (local)
		{
			if (VERBOSE > 1)
				std::cerr << "Using existing file " << local->path << '\n';
			return *local;
		}
	}

	fetch_result result;

	fs::create_directories(layout.raw_dir, ec);
	if (ec)
	{
		result.detail = "cannot create " + layout.raw_dir.string() + ": " + ec.message();
		ec = make_error_code(errc::unavailable);
		return result;
	}

	for (auto format : { structure_format::pdb, structure_format::mmcif })
	{
		auto url = m_base_url + id + '.' + std::string{ get_extension(format) };
		auto dest = layout.get_raw_path(id, format);

		std::error_code dl_ec;

		for (uint32_t attempt = 1; attempt <= m_attempts; ++attempt)
		{
			dl_ec.clear();
			download(url, dest, dl_ec);

			// retry only transient failures, a missing file will stay missing
			if (dl_ec != errc::network_failure and dl_ec != errc::timeout)
				break;

			if (VERBOSE > 0)
				std::cerr << "Download of " << url << " failed (attempt " << attempt << " of " << m_attempts << "): " << dl_ec.message() << '\n';

			if (attempt < m_attempts)
				std::this_thread::sleep_for(m_retry_delay);
		}

		if (not dl_ec)
		{
			if (VERBOSE > 1)
				std::cerr << "Downloaded " << id << " in " << to_string(format) << " format\n";

			result.path = dest;
			result.format = format;
			result.downloaded = true;
			return result;
		}

		if (not result.detail.empty())
			result.detail += "; ";
		result.detail += std::string{ to_string(format) } + ": " + dl_ec.message();
	}

	if (VERBOSE > 0)
		std::cerr << "Could not retrieve " << id << ": " << result.detail << '\n';

	ec = make_error_code(errc::unavailable);
	return result;
}

void source_fetcher::download(const std::string &url, const fs::path &dest, std::error_code &ec) const
{
	auto tmp = temporary_path_for(dest);

	{
		std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
		if (not out.is_open())
		{
			ec = make_error_code(errc::io_failure);
			return;
		}

		m_client.get(url, out, ec);

		out.close();
		if (not ec and not out)
			ec = make_error_code(errc::io_failure);
	}

	if (not ec)
	{
		std::error_code size_ec;
		auto size = fs::file_size(tmp, size_ec);

		if (size_ec)
			ec = make_error_code(errc::io_failure);
		else if (size == 0) // an empty answer is as good as no answer
			ec = make_error_code(errc::not_found);
	}

	if (ec)
	{
		std::error_code ignore;
		fs::remove(tmp, ignore);
		return;
	}

	commit_file(tmp, dest, ec);
}

} // namespace abag
