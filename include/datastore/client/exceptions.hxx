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

#include <stdexcept>
#include <string>

namespace datastore
{
/**
 * Status codes reported by the remote store.  These follow the canonical RPC codes.
 */
enum class status_code {
    OK = 0,
    CANCELLED,
    UNKNOWN,
    INVALID_ARGUMENT,
    DEADLINE_EXCEEDED,
    NOT_FOUND,
    ALREADY_EXISTS,
    PERMISSION_DENIED,
    RESOURCE_EXHAUSTED,
    FAILED_PRECONDITION,
    ABORTED,
    OUT_OF_RANGE,
    UNIMPLEMENTED,
    INTERNAL,
    UNAVAILABLE,
    DATA_LOSS,
    UNAUTHENTICATED
};

inline const char*
status_code_name(status_code code)
{
    switch (code) {
        case status_code::OK:
            return "OK";
        case status_code::CANCELLED:
            return "CANCELLED";
        case status_code::UNKNOWN:
            return "UNKNOWN";
        case status_code::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case status_code::DEADLINE_EXCEEDED:
            return "DEADLINE_EXCEEDED";
        case status_code::NOT_FOUND:
            return "NOT_FOUND";
        case status_code::ALREADY_EXISTS:
            return "ALREADY_EXISTS";
        case status_code::PERMISSION_DENIED:
            return "PERMISSION_DENIED";
        case status_code::RESOURCE_EXHAUSTED:
            return "RESOURCE_EXHAUSTED";
        case status_code::FAILED_PRECONDITION:
            return "FAILED_PRECONDITION";
        case status_code::ABORTED:
            return "ABORTED";
        case status_code::OUT_OF_RANGE:
            return "OUT_OF_RANGE";
        case status_code::UNIMPLEMENTED:
            return "UNIMPLEMENTED";
        case status_code::INTERNAL:
            return "INTERNAL";
        case status_code::UNAVAILABLE:
            return "UNAVAILABLE";
        case status_code::DATA_LOSS:
            return "DATA_LOSS";
        case status_code::UNAUTHENTICATED:
            return "UNAUTHENTICATED";
        default:
            throw std::runtime_error("unknown status code");
    }
}

/**
 * @brief Error raised by a @ref datastore_api implementation.
 *
 * The transaction core never wraps or retries these, they reach the caller exactly as the
 * transport raised them.
 */
class rpc_error : public std::runtime_error
{
  private:
    status_code code_;

  public:
    rpc_error(status_code code, const std::string& what)
      : std::runtime_error(what)
      , code_(code)
    {
    }

    status_code code() const
    {
        return code_;
    }
};

/**
 * @brief A key (or an entity's key) cannot be used for the requested operation.
 */
class invalid_key : public std::runtime_error
{
  public:
    explicit invalid_key(const std::string& what)
      : std::runtime_error(what)
    {
    }
};
} // namespace datastore
