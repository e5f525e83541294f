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

#include <cstdint>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <datastore/support.hxx>
#include <nlohmann/json.hpp>

namespace datastore
{
/**
 * One (kind, identifier) pair of a key path.  An element with neither an id nor a name is
 * waiting for the server to allocate its id.
 */
struct path_element {
    std::string kind;
    boost::optional<std::int64_t> id;
    boost::optional<std::string> name;

    path_element() = default;

    explicit path_element(std::string k)
      : kind(std::move(k))
    {
    }

    path_element(std::string k, std::int64_t i)
      : kind(std::move(k))
      , id(i)
    {
    }

    path_element(std::string k, std::string n)
      : kind(std::move(k))
      , name(std::move(n))
    {
    }

    DS_NODISCARD bool is_partial() const
    {
        return !id && !name;
    }

    bool operator==(const path_element& other) const
    {
        return kind == other.kind && id == other.id && name == other.name;
    }

    bool operator!=(const path_element& other) const
    {
        return !(*this == other);
    }
};

/**
 * @brief Identity of an entity in the store.
 *
 * A key is scoped to a project and namespace and is made of an ordered path of
 * @ref path_element, the last of which names the entity itself.  A key is "partial" when
 * the last element has no identifier yet; committing an entity with a partial key makes the
 * server allocate one.
 *
 * @code{.cpp}
 * datastore::key k("my-project", "", { { "Parent", "p1" }, path_element("Child") });
 * assert(k.is_partial());
 * auto done = k.completed_key(1234);
 * @endcode
 */
class key
{
  private:
    std::string project_;
    std::string namespace_name_;
    std::vector<path_element> path_;

  public:
    key() = default;

    key(std::string project, std::string namespace_name, std::vector<path_element> path);

    DS_NODISCARD const std::string& project() const
    {
        return project_;
    }

    DS_NODISCARD const std::string& namespace_name() const
    {
        return namespace_name_;
    }

    DS_NODISCARD const std::vector<path_element>& path() const
    {
        return path_;
    }

    /**
     * @brief Replace the path of this key in place.
     *
     * Used when the server returns the completed path for an entity inserted with a partial key.
     */
    void path(std::vector<path_element> new_path)
    {
        path_ = std::move(new_path);
    }

    DS_NODISCARD bool empty() const
    {
        return path_.empty();
    }

    /**
     * @brief Is the key still waiting for a server-assigned identifier?
     *
     * An empty key is considered partial.
     */
    DS_NODISCARD bool is_partial() const
    {
        return path_.empty() || path_.back().is_partial();
    }

    DS_NODISCARD bool is_complete() const
    {
        return !is_partial();
    }

    DS_NODISCARD const std::string& kind() const;

    /**
     * @brief Copy of this key with the given id in its last element.
     *
     * @throws invalid_key if the key is empty or already complete.
     */
    DS_NODISCARD key completed_key(std::int64_t id) const;

    DS_NODISCARD std::string to_string() const;

    bool operator==(const key& other) const
    {
        return project_ == other.project_ && namespace_name_ == other.namespace_name_ && path_ == other.path_;
    }

    bool operator!=(const key& other) const
    {
        return !(*this == other);
    }

    template<typename OStream>
    friend OStream& operator<<(OStream& os, const key& k)
    {
        os << k.to_string();
        return os;
    }
};

void
to_json(nlohmann::json& j, const path_element& e);
void
from_json(const nlohmann::json& j, path_element& e);
void
to_json(nlohmann::json& j, const key& k);
void
from_json(const nlohmann::json& j, key& k);
} // namespace datastore
