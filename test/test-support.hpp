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

#include <abag.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// --------------------------------------------------------------------
// An archive_client serving files from memory. Files can be made to fail
// a number of times with a given error before they are served.

class fake_archive : public abag::archive_client
{
  public:
	void add(const std::string &name, std::string content)
	{
		std::lock_guard lock(m_mutex);
		m_files[name] = std::move(content);
	}

	void fail(const std::string &name, abag::errc code, int times = -1)
	{
		std::lock_guard lock(m_mutex);
		m_failures[name] = { code, times };
	}

	/// Called with the URL of each request, before it is answered
	void on_request(std::function<void(const std::string &)> handler)
	{
		m_on_request = std::move(handler);
	}

	void get(const std::string &url, std::ostream &out, std::error_code &ec) override
	{
		if (m_on_request)
			m_on_request(url);

		std::lock_guard lock(m_mutex);

		++m_calls;
		m_requests.push_back(url);

		auto name = url.substr(url.rfind('/') + 1);

		auto fi = m_failures.find(name);
		if (fi != m_failures.end() and fi->second.second != 0)
		{
			if (fi->second.second > 0)
				--fi->second.second;
			ec = make_error_code(fi->second.first);
			return;
		}

		auto i = m_files.find(name);
		if (i == m_files.end())
		{
			ec = make_error_code(abag::errc::not_found);
			return;
		}

		out << i->second;
	}

	size_t get_call_count() const { return m_calls; }

	std::vector<std::string> get_requests() const
	{
		std::lock_guard lock(m_mutex);
		return m_requests;
	}

  private:
	mutable std::mutex m_mutex;
	std::map<std::string, std::string> m_files;
	std::map<std::string, std::pair<abag::errc, int>> m_failures;
	std::vector<std::string> m_requests;
	std::atomic<size_t> m_calls = 0;
	std::function<void(const std::string &)> m_on_request;
};

// --------------------------------------------------------------------
// Create a structure with chains of the given lengths, one CA atom per
// residue, residues numbered from 1.

inline abag::structure make_structure(const std::string &id, const std::vector<std::pair<std::string, int>> &chains)
{
	abag::structure s(id, abag::structure_format::pdb);

	float x = 0;

	for (auto &[chain_id, length] : chains)
	{
		abag::chain c(chain_id);

		for (int nr = 1; nr <= length; ++nr)
		{
			abag::residue r(abag::residue_number(nr), "ALA");

			abag::atom a;
			a.name = "CA";
			a.element = "C";
			a.x = x;
			a.y = 1.5f;
			a.z = -2.25f;
			a.b_factor = 20;
			x += 3.8f;

			r.add_atom(a);
			c.push_back(r);
		}

		s.add_chain(c);
	}

	return s;
}

/// The PDB formatted text of make_structure(id, chains)
inline std::string make_pdb(const std::string &id, const std::vector<std::pair<std::string, int>> &chains)
{
	std::ostringstream os;
	std::error_code ec;
	abag::write(os, make_structure(id, chains), ec);
	return os.str();
}

// --------------------------------------------------------------------
// A fresh, empty, directory for a test

inline std::filesystem::path scratch_dir(const std::string &name)
{
	auto dir = std::filesystem::temp_directory_path() / ("abag-test-" + name);
	std::filesystem::remove_all(dir);
	std::filesystem::create_directories(dir);
	return dir;
}

/// A configuration for @a dir that does not wait between download attempts
inline abag::config test_config(const std::filesystem::path &dir)
{
	abag::config cfg(dir);
	cfg.archive_url = "https://archive.test/download/";
	cfg.retry_delay = std::chrono::milliseconds(0);
	return cfg;
}
