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
#include <datastore/longrunning/exceptions.hxx>
#include <datastore/longrunning/metadata_registry.hxx>
#include <datastore/support.hxx>
#include <nlohmann/json.hpp>

namespace datastore
{
namespace longrunning
{
    /**
     * A serialized message tagged with its type url.
     */
    struct any_value {
        std::string type_url;
        std::string value;
    };

    /**
     * State of an operation as reported by the server.
     */
    struct operation_status {
        std::string name;
        bool done{ false };
        boost::optional<any_value> metadata;
    };

    /**
     * @brief RPC surface for polling long-running operations.
     */
    class operations_api
    {
      public:
        virtual ~operations_api() = default;

        virtual operation_status get_operation(const std::string& name) = 0;
    };

    /**
     * @brief A long-running server operation (an export, an index build...).
     *
     * Poll with @ref finished until it returns true:
     *
     * @code{.cpp}
     * auto op = operation::from_status(status, api, registry);
     * while (!op.finished()) {
     *     std::this_thread::sleep_for(std::chrono::seconds(1));
     * }
     * @endcode
     */
    class operation
    {
      public:
        operation(std::string name, operations_api& api, nlohmann::json metadata = nlohmann::json::object());

        /**
         * @brief Build an operation from a server status, decoding its metadata if the registry
         * knows the metadata's type url.
         */
        static operation from_status(const operation_status& status, operations_api& api, const metadata_registry& registry);

        DS_NODISCARD const std::string& name() const
        {
            return name_;
        }

        DS_NODISCARD const nlohmann::json& metadata() const
        {
            return metadata_;
        }

        /**
         * @brief Whether the operation was seen complete by a previous @ref finished call.
         */
        DS_NODISCARD bool complete() const
        {
            return complete_;
        }

        /**
         * @brief Poll the server once.
         *
         * @return true if the operation has completed.
         * @throws operation_complete_error if the operation was already seen complete.
         */
        bool finished();

      private:
        std::string name_;
        operations_api& api_;
        nlohmann::json metadata_;
        bool complete_{ false };
    };
} // namespace longrunning
} // namespace datastore
