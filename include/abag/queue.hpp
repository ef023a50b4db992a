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

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

/**
 * @file queue.hpp
 *
 * A bounded blocking queue, used to hand work to worker threads and to
 * collect their results in a single thread.
 */

namespace abag
{

/**
 * @brief A thread safe FIFO queue holding at most @a N elements. push
 * blocks while the queue is full, pop blocks while it is empty.
 *
 * There is no close operation, producers signal the end of the input by
 * pushing a sentinel value agreed upon with the consumers.
 */
template <typename T, size_t N = 100>
class blocking_queue
{
  public:
	void push(T const &v)
	{
		std::unique_lock lock(m_mutex);

		m_full_cv.wait(lock, [this]()
			{ return m_queue.size() < N; });

		m_queue.push(v);

		m_empty_cv.notify_one();
	}

	T pop()
	{
		std::unique_lock lock(m_mutex);

		m_empty_cv.wait(lock, [this]()
			{ return not m_queue.empty(); });

		auto v = std::move(m_queue.front());
		m_queue.pop();

		m_full_cv.notify_one();

		return v;
	}

  private:
	std::queue<T> m_queue;
	std::mutex m_mutex;
	std::condition_variable m_empty_cv, m_full_cv;
};

} // namespace abag
