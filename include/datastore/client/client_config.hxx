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

#include <string>

#include <boost/optional.hpp>
#include <datastore/client/logging.hxx>
#include <datastore/support.hxx>

#define DS_ENV_PROJECT_ID "DATASTORE_PROJECT_ID"
#define DS_ENV_FALLBACK_PROJECT_ID "GOOGLE_CLOUD_PROJECT"
#define DS_ENV_NAMESPACE "DATASTORE_NAMESPACE"

namespace datastore
{
/**
 * @brief Settings for a @ref client.
 *
 * The setters return a reference to this object so calls can be chained:
 *
 * @code{.cpp}
 * auto config = client_config().project("my-project").namespace_name("staging").log_level(log_level::DEBUG);
 * @endcode
 */
class client_config
{
  private:
    std::string project_;
    std::string namespace_name_;
    boost::optional<enum log_level> log_level_;

  public:
    client_config() = default;

    explicit client_config(std::string project)
      : project_(std::move(project))
    {
    }

    DS_NODISCARD const std::string& project() const
    {
        return project_;
    }

    client_config& project(std::string project)
    {
        project_ = std::move(project);
        return *this;
    }

    /**
     * @brief Namespace used for keys built by the client.  Empty means the default namespace.
     */
    DS_NODISCARD const std::string& namespace_name() const
    {
        return namespace_name_;
    }

    client_config& namespace_name(std::string namespace_name)
    {
        namespace_name_ = std::move(namespace_name);
        return *this;
    }

    /**
     * @brief Log level to apply to the library loggers when the client is created, if set.
     */
    DS_NODISCARD boost::optional<enum log_level> log_level() const
    {
        return log_level_;
    }

    client_config& log_level(enum log_level level)
    {
        log_level_ = level;
        return *this;
    }

    /**
     * @brief Build a config from the environment.
     *
     * Reads the project from DATASTORE_PROJECT_ID, falling back to GOOGLE_CLOUD_PROJECT, and the
     * namespace from DATASTORE_NAMESPACE.
     *
     * @throws std::invalid_argument if no project is set.
     */
    static client_config from_env();
};
} // namespace datastore
