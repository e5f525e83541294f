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

#include "../client/logging.hxx"
#include <datastore/longrunning/operation.hxx>

namespace datastore
{
namespace longrunning
{
    operation::operation(std::string name, operations_api& api, nlohmann::json metadata)
      : name_(std::move(name))
      , api_(api)
      , metadata_(std::move(metadata))
    {
    }

    operation operation::from_status(const operation_status& status, operations_api& api, const metadata_registry& registry)
    {
        nlohmann::json metadata = nlohmann::json::object();
        if (status.metadata && !status.metadata->type_url.empty()) {
            if (auto decoded = registry.decode(status.metadata->type_url, status.metadata->value)) {
                metadata = *decoded;
            } else {
                client_log->debug("no decoder registered for {}, operation {} has no metadata", status.metadata->type_url, status.name);
            }
        }
        return operation(status.name, api, metadata);
    }

    bool operation::finished()
    {
        if (complete_) {
            throw operation_complete_error("The operation has completed.");
        }
        auto status = api_.get_operation(name_);
        if (status.done) {
            client_log->debug("operation {} completed", name_);
            complete_ = true;
        }
        return complete_;
    }
} // namespace longrunning
} // namespace datastore
