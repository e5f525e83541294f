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

#include <datastore/longrunning/metadata_registry.hxx>

namespace datastore
{
namespace longrunning
{
    std::string compute_type_url(const std::string& full_name, const std::string& prefix)
    {
        return prefix + "/" + full_name;
    }

    void metadata_registry::register_type(const std::string& type_url, const std::string& type_name, decoder fn)
    {
        auto it = entries_.find(type_url);
        if (it != entries_.end() && it->second.type_name != type_name) {
            throw registration_conflict("Conflict: " + type_url + " is registered to " + it->second.type_name);
        }
        entries_[type_url] = entry{ type_name, std::move(fn) };
    }

    boost::optional<nlohmann::json> metadata_registry::decode(const std::string& type_url, const std::string& value) const
    {
        auto it = entries_.find(type_url);
        if (it == entries_.end()) {
            return {};
        }
        return it->second.fn(value);
    }
} // namespace longrunning
} // namespace datastore
