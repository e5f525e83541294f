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

#include <datastore/client/entity.hxx>
#include <datastore/client/mutation.hxx>

#include <stdexcept>
#include <string>

namespace datastore
{
entity::entity(datastore::key k, nlohmann::json properties)
  : key_(std::move(k))
  , properties_(std::move(properties))
{
    if (!properties_.is_object()) {
        throw std::invalid_argument("entity properties must be a json object, got " + std::string(properties_.type_name()));
    }
}

void
to_json(nlohmann::json& j, const entity& e)
{
    j = nlohmann::json{ { "key", e.key() }, { "properties", e.properties() } };
    if (!e.exclude_from_indexes().empty()) {
        j["exclude_from_indexes"] = e.exclude_from_indexes();
    }
}

void
from_json(const nlohmann::json& j, entity& e)
{
    e = entity(j.at("key").get<key>(), j.value("properties", nlohmann::json::object()));
    if (j.contains("exclude_from_indexes")) {
        e.exclude_from_indexes(j.at("exclude_from_indexes").get<std::set<std::string>>());
    }
}

void
to_json(nlohmann::json& j, const mutation& m)
{
    switch (m.type()) {
        case mutation_type::UPSERT:
            j = nlohmann::json{ { "upsert", { { "key", m.key() }, { "properties", m.properties() } } } };
            if (!m.exclude_from_indexes().empty()) {
                j["upsert"]["exclude_from_indexes"] = m.exclude_from_indexes();
            }
            break;
        case mutation_type::REMOVE:
            j = nlohmann::json{ { "delete", m.key() } };
            break;
    }
}
} // namespace datastore
