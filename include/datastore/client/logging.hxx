/*
 *     Copyright 2021 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

namespace datastore
{
/**
 * Log levels understood by the library loggers.  See @ref set_client_log_level.
 */
enum class log_level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };

/**
 * @brief Set the level of the client logger.
 *
 * The client logger reports lookups and implicit batches issued by @ref client.
 */
void
set_client_log_level(log_level level);
} // namespace datastore
