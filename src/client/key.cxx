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

#include <datastore/client/exceptions.hxx>
#include <datastore/client/key.hxx>

#include <sstream>

namespace datastore
{
key::key(std::string project, std::string namespace_name, std::vector<path_element> path)
  : project_(std::move(project))
  , namespace_name_(std::move(namespace_name))
  , path_(std::move(path))
{
    for (size_t i = 0; i < path_.size(); ++i) {
        if (path_[i].kind.empty()) {
            throw invalid_key("path element " + std::to_string(i) + " has no kind");
        }
        if (path_[i].id && path_[i].name) {
            throw invalid_key("path element " + std::to_string(i) + " has both an id and a name");
        }
        // only the last element may be waiting for an id
        if (i + 1 < path_.size() && path_[i].is_partial()) {
            throw invalid_key("parent path element " + std::to_string(i) + " (" + path_[i].kind + ") is incomplete");
        }
    }
}

const std::string&
key::kind() const
{
    if (path_.empty()) {
        throw invalid_key("empty key has no kind");
    }
    return path_.back().kind;
}

key
key::completed_key(std::int64_t id) const
{
    if (path_.empty()) {
        throw invalid_key("cannot complete an empty key");
    }
    if (!is_partial()) {
        throw invalid_key("only a partial key can be completed, got " + to_string());
    }
    key completed(*this);
    completed.path_.back().id = id;
    return completed;
}

std::string
key::to_string() const
{
    std::ostringstream os;
    os << "key{" << project_;
    if (!namespace_name_.empty()) {
        os << "/" << namespace_name_;
    }
    os << ":";
    for (size_t i = 0; i < path_.size(); ++i) {
        if (i > 0) {
            os << "/";
        }
        os << path_[i].kind << ",";
        if (path_[i].id) {
            os << *path_[i].id;
        } else if (path_[i].name) {
            os << "'" << *path_[i].name << "'";
        } else {
            os << "?";
        }
    }
    os << "}";
    return os.str();
}

void
to_json(nlohmann::json& j, const path_element& e)
{
    j = nlohmann::json{ { "kind", e.kind } };
    if (e.id) {
        j["id"] = *e.id;
    }
    if (e.name) {
        j["name"] = *e.name;
    }
}

void
from_json(const nlohmann::json& j, path_element& e)
{
    j.at("kind").get_to(e.kind);
    e.id = boost::none;
    e.name = boost::none;
    if (j.contains("id")) {
        e.id = j.at("id").get<std::int64_t>();
    }
    if (j.contains("name")) {
        e.name = j.at("name").get<std::string>();
    }
}

void
to_json(nlohmann::json& j, const key& k)
{
    j = nlohmann::json{ { "project", k.project() }, { "namespace", k.namespace_name() }, { "path", k.path() } };
}

void
from_json(const nlohmann::json& j, key& k)
{
    k = key(j.at("project").get<std::string>(), j.value("namespace", std::string()), j.at("path").get<std::vector<path_element>>());
}
} // namespace datastore
