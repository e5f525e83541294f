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
#include <stdexcept>
#include <string>

#include <datastore/client/entity.hxx>
#include <datastore/client/key.hxx>
#include <datastore/support.hxx>
#include <nlohmann/json.hpp>

namespace datastore
{
enum class mutation_type { UPSERT, REMOVE };

inline const char*
mutation_type_name(mutation_type type)
{
    switch (type) {
        case mutation_type::UPSERT:
            return "UPSERT";
        case mutation_type::REMOVE:
            return "REMOVE";
        default:
            throw std::runtime_error("unknown mutation type");
    }
}

/**
 * @brief One staged write.
 *
 * An upsert carries a snapshot of the entity's properties taken when it was staged; later
 * changes to the entity do not affect the mutation.
 */
class mutation
{
  private:
    mutation_type type_;
    datastore::key key_;
    nlohmann::json properties_;
    std::set<std::string> exclude_from_indexes_;

    mutation(mutation_type type, datastore::key k, nlohmann::json properties)
      : type_(type)
      , key_(std::move(k))
      , properties_(std::move(properties))
    {
    }

  public:
    static mutation upsert(const entity& e)
    {
        mutation m(mutation_type::UPSERT, e.key(), e.properties());
        m.exclude_from_indexes_ = e.exclude_from_indexes();
        return m;
    }

    static mutation remove(const datastore::key& k)
    {
        return mutation(mutation_type::REMOVE, k, nlohmann::json());
    }

    DS_NODISCARD mutation_type type() const
    {
        return type_;
    }

    DS_NODISCARD const datastore::key& key() const
    {
        return key_;
    }

    DS_NODISCARD const nlohmann::json& properties() const
    {
        return properties_;
    }

    DS_NODISCARD const std::set<std::string>& exclude_from_indexes() const
    {
        return exclude_from_indexes_;
    }

    bool operator==(const mutation& other) const
    {
        return type_ == other.type_ && key_ == other.key_ && properties_ == other.properties_ &&
               exclude_from_indexes_ == other.exclude_from_indexes_;
    }

    bool operator!=(const mutation& other) const
    {
        return !(*this == other);
    }
};

void
to_json(nlohmann::json& j, const mutation& m);
} // namespace datastore
