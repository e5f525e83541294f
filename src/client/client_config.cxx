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

#include <datastore/client/client_config.hxx>

#include <cstdlib>
#include <stdexcept>

namespace datastore
{
namespace
{
    boost::optional<std::string> env(const char* name)
    {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return {};
        }
        return std::string(value);
    }
} // namespace

client_config
client_config::from_env()
{
    auto project = env(DS_ENV_PROJECT_ID);
    if (!project) {
        project = env(DS_ENV_FALLBACK_PROJECT_ID);
    }
    if (!project) {
        throw std::invalid_argument("no project configured, set " DS_ENV_PROJECT_ID " or " DS_ENV_FALLBACK_PROJECT_ID);
    }
    client_config config(*project);
    if (auto ns = env(DS_ENV_NAMESPACE)) {
        config.namespace_name(*ns);
    }
    return config;
}
} // namespace datastore
