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

#include <datastore/client/client.hxx>
#include <datastore/client/client_config.hxx>
#include <datastore/client/datastore_api.hxx>
#include <datastore/client/entity.hxx>
#include <datastore/client/exceptions.hxx>
#include <datastore/client/in_memory_api.hxx>
#include <datastore/client/key.hxx>
#include <datastore/transactions/batch.hxx>
#include <datastore/transactions/exceptions.hxx>
#include <datastore/transactions/logging.hxx>
#include <datastore/transactions/transaction.hxx>
#include <datastore/transactions/unit_of_work_stack.hxx>

/**
 * @mainpage
 * Units of work for a remote datastore.  A @ref datastore::client binds a project to a
 * @ref datastore::datastore_api; batches and transactions opened on it buffer writes and send
 * them in one commit:
 *
 * @code{.cpp}
 * datastore::in_memory_api api;
 * datastore::client client(datastore::client_config("my-project"), api);
 *
 * datastore::entity task(client.key({ datastore::path_element("Task") }));
 * task.set("description", "write docs");
 *
 * try {
 *     client.new_transaction()->run([&](datastore::transactions::transaction& txn) {
 *         txn.put(task);
 *     });
 *     cout << "saved as " << task.key() << endl;
 * } catch (const datastore::rpc_error& e) {
 *     cerr << "commit failed: " << e.what() << endl;
 * }
 * @endcode
 *
 * For a longer example, see @ref examples/inventory.cxx
 *
 * @example examples/inventory.cxx
 */
