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

#include <functional>
#include <map>
#include <string>

#include <boost/optional.hpp>
#include <datastore/longrunning/exceptions.hxx>
#include <datastore/support.hxx>
#include <nlohmann/json.hpp>

namespace datastore
{
namespace longrunning
{
    static const std::string GOOGLE_APIS_PREFIX = "types.googleapis.com";

    /**
     * @brief Type url for a fully-qualified message name, e.g.
     * "types.googleapis.com/google.datastore.admin.v1.ExportEntitiesMetadata".
     */
    std::string compute_type_url(const std::string& full_name, const std::string& prefix = GOOGLE_APIS_PREFIX);

    /**
     * @brief Maps type urls to decoders for operation metadata.
     *
     * Owned by whoever decodes operations; there is no process-wide registry.
     */
    class metadata_registry
    {
      public:
        /** Turns the serialized metadata payload into json. */
        typedef std::function<nlohmann::json(const std::string&)> decoder;

        /**
         * @brief Register the decoder for a type url.
         *
         * Registering the same type name again replaces its decoder.
         *
         * @throws registration_conflict if another type name is registered for the url.
         */
        void register_type(const std::string& type_url, const std::string& type_name, decoder fn);

        DS_NODISCARD bool contains(const std::string& type_url) const
        {
            return entries_.count(type_url) > 0;
        }

        /**
         * @brief Decode a payload with the decoder registered for the url.
         *
         * @return the decoded metadata, or none if nothing is registered for the url.
         */
        DS_NODISCARD boost::optional<nlohmann::json> decode(const std::string& type_url, const std::string& value) const;

      private:
        struct entry {
            std::string type_name;
            decoder fn;
        };
        std::map<std::string, entry> entries_;
    };
} // namespace longrunning
} // namespace datastore
