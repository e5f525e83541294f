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

#include <set>
#include <string>

#include <datastore/client/key.hxx>
#include <datastore/support.hxx>
#include <nlohmann/json.hpp>

namespace datastore
{
/**
 * @brief An entity: a key plus a JSON object of properties.
 *
 * Units of work keep pointers to the exact entity objects handed to them, so that keys
 * allocated by the server can be written back once the unit of work commits.  Entities must
 * therefore outlive the batch or transaction they were put into.
 *
 * @code{.cpp}
 * datastore::entity e(client.key({ path_element("Task") }));
 * e.set("description", "buy milk");
 * e.set("done", false);
 * @endcode
 */
class entity
{
  private:
    datastore::key key_;
    nlohmann::json properties_;
    std::set<std::string> exclude_from_indexes_;

  public:
    entity()
      : properties_(nlohmann::json::object())
    {
    }

    explicit entity(datastore::key k, nlohmann::json properties = nlohmann::json::object());

    DS_NODISCARD const datastore::key& key() const
    {
        return key_;
    }

    DS_NODISCARD datastore::key& key()
    {
        return key_;
    }

    void key(datastore::key k)
    {
        key_ = std::move(k);
    }

    DS_NODISCARD const nlohmann::json& properties() const
    {
        return properties_;
    }

    DS_NODISCARD nlohmann::json& properties()
    {
        return properties_;
    }

    template<typename Content>
    void set(const std::string& name, const Content& value)
    {
        properties_[name] = value;
    }

    template<typename Content>
    Content get(const std::string& name) const
    {
        return properties_.at(name).get<Content>();
    }

    DS_NODISCARD bool contains(const std::string& name) const
    {
        return properties_.find(name) != properties_.end();
    }

    DS_NODISCARD const std::set<std::string>& exclude_from_indexes() const
    {
        return exclude_from_indexes_;
    }

    void exclude_from_indexes(std::set<std::string> names)
    {
        exclude_from_indexes_ = std::move(names);
    }

    bool operator==(const entity& other) const
    {
        return key_ == other.key_ && properties_ == other.properties_;
    }
};

void
to_json(nlohmann::json& j, const entity& e);
void
from_json(const nlohmann::json& j, entity& e);
} // namespace datastore
