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

#include "abag/utilities.hpp"
#include "abag/error.hpp"

#include "revision.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <fstream>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace abag
{

int VERBOSE = 0;

// --------------------------------------------------------------------

std::string get_version_nr()
{
	return kVersionNumber;
}

uint32_t get_terminal_width()
{
	uint32_t result = 80;

	if (isatty(STDOUT_FILENO))
	{
		struct winsize w;
		if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 and w.ws_col > 0)
			result = w.ws_col;
	}

	return result;
}

// --------------------------------------------------------------------

struct progress_bar_impl
{
	progress_bar_impl(int64_t inMax, const std::string &inAction)
		: m_max_value(inMax > 0 ? inMax : 1)
		, m_action(inAction)
		, m_message(inAction)
		, m_thread(std::bind(&progress_bar_impl::run, this))
	{
	}

	progress_bar_impl(const progress_bar_impl &) = delete;
	progress_bar_impl &operator=(const progress_bar_impl &) = delete;

	~progress_bar_impl()
	{
		m_stop = true;
		m_thread.join();
	}

	void run();
	void print_progress();
	void print_done();

	using clock_type = std::chrono::steady_clock;

	int64_t m_max_value;
	std::atomic<int64_t> m_consumed = 0;
	std::string m_action, m_message;
	std::mutex m_mutex;
	clock_type::time_point m_start = clock_type::now();
	std::atomic<bool> m_stop = false;
	std::thread m_thread;
};

void progress_bar_impl::run()
{
	using namespace std::literals;

	bool printed_any = false;
	auto last = m_start;

	while (not m_stop)
	{
		std::this_thread::sleep_for(10ms);

		auto now = clock_type::now();
		if (now - m_start < 1s or now - last < 100ms)
			continue;

		std::lock_guard lock(m_mutex);
		print_progress();

		printed_any = true;
		last = now;
	}

	if (printed_any)
		print_done();
}

void progress_bar_impl::print_progress()
{
	const uint32_t kMinBarWidth = 40, kMinMsgWidth = 12;

	uint32_t width = get_terminal_width();
	float progress = static_cast<float>(m_consumed) / m_max_value;

	if (width < kMinBarWidth)
	{
		std::cout << '\r' << static_cast<int>(100 * progress) << '%';
		std::cout.flush();
		return;
	}

	uint32_t bar_width = 6 * width / 10;
	uint32_t msg_width = width - bar_width - 8;
	if (msg_width < kMinMsgWidth)
	{
		bar_width -= kMinMsgWidth - msg_width;
		msg_width = kMinMsgWidth;
	}

	std::ostringstream line;

	if (m_message.length() <= msg_width)
		line << m_message << std::string(msg_width - m_message.length(), ' ');
	else
		line << m_message.substr(0, msg_width - 3) << "...";

	line << ' ';

	auto filled = static_cast<uint32_t>(std::ceil(progress * bar_width));
	for (uint32_t i = 0; i < bar_width; ++i)
		line << (i < filled ? '=' : '-');

	line << ' ' << std::setw(3) << static_cast<int>(std::ceil(progress * 100)) << '%';

	std::cout << '\r' << line.str();
	std::cout.flush();
}

void progress_bar_impl::print_done()
{
	std::chrono::duration<double> elapsed = clock_type::now() - m_start;

	std::ostringstream msg;
	msg << m_action << " done in " << std::fixed << std::setprecision(1) << elapsed.count() << " seconds";
	auto s = msg.str();

	uint32_t width = get_terminal_width();
	if (s.length() < width)
		s += std::string(width - s.length(), ' ');

	std::cout << '\r' << s << '\n';
}

progress_bar::progress_bar(int64_t inMax, const std::string &inAction)
	: m_impl(nullptr)
{
	if (isatty(STDOUT_FILENO) and VERBOSE >= 0)
		m_impl = new progress_bar_impl(inMax, inAction);
}

progress_bar::~progress_bar()
{
	delete m_impl;
}

void progress_bar::consumed(int64_t inConsumed)
{
	if (m_impl != nullptr)
		m_impl->m_consumed += inConsumed;
}

void progress_bar::message(const std::string &inMessage)
{
	if (m_impl != nullptr)
	{
		std::lock_guard lock(m_impl->m_mutex);
		m_impl->m_message = inMessage;
	}
}

// --------------------------------------------------------------------

fs::path temporary_path_for(const fs::path &dest)
{
	std::ostringstream name;
	name << '.' << dest.filename().string()
		 << '.' << getpid()
		 << '-' << std::hash<std::thread::id>{}(std::this_thread::get_id())
		 << ".part";

	return dest.parent_path() / name.str();
}

void commit_file(const fs::path &tmp, const fs::path &dest, std::error_code &ec)
{
	// rename is atomic as long as tmp and dest share a file system,
	// which temporary_path_for guarantees
	fs::rename(tmp, dest, ec);

	if (ec)
	{
		if (VERBOSE > 0)
			std::cerr << "Could not move " << tmp << " to " << dest << ": " << ec.message() << '\n';

		std::error_code ignore;
		fs::remove(tmp, ignore);

		ec = make_error_code(errc::io_failure);
	}
}

void write_file_atomically(const fs::path &dest, std::string_view data, std::error_code &ec)
{
	auto tmp = temporary_path_for(dest);

	{
		std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
		if (out.is_open())
		{
			out.write(data.data(), data.length());
			out.close();
		}

		if (not out)
		{
			if (VERBOSE > 0)
				std::cerr << "Could not write " << tmp << '\n';

			std::error_code ignore;
			fs::remove(tmp, ignore);

			ec = make_error_code(errc::io_failure);
			return;
		}
	}

	commit_file(tmp, dest, ec);
}

} // namespace abag
