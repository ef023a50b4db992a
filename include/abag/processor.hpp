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
#include "abag/fetcher.hpp"
#include "abag/outcome.hpp"
#include "abag/splitter.hpp"

#include <string>

/**
 * @file processor.hpp
 *
 * Processing of a single entry: fetch, parse, split and write.
 */

namespace abag
{

/**
 * @brief Runs one entry through all stages and reports an outcome_record.
 *
 * The stages are executed in order, the first one that fails determines
 * the status of the outcome:
 *
 * | stage    | status on failure |
 * |----------|-------------------|
 * | fetch    | download_failed   |
 * | parse    | parse_failed      |
 * | split    | chain_not_found   |
 * | write    | write_failed      |
 *
 * Failures never escape as exceptions, they are all reported in the
 * outcome. A single entry_processor can be used from several threads at
 * once as long as they process different entries.
 */
class entry_processor
{
  public:
	entry_processor(const config &cfg, archive_client &client);

	entry_processor(const entry_processor &) = delete;
	entry_processor &operator=(const entry_processor &) = delete;

	/// \brief Process the entry @a id using @a assignment, using the force setting of the configuration
	outcome_record process(const std::string &id, const chain_assignment &assignment) const
	{
		return process(id, assignment, m_config.force);
	}

	/// \brief Process the entry @a id using @a assignment, @a force overrides the configuration
	outcome_record process(const std::string &id, const chain_assignment &assignment, bool force) const;

  private:
	config m_config;
	output_layout m_layout;
	source_fetcher m_fetcher;
};

} // namespace abag
