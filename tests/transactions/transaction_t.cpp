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

#include "helpers.hxx"
#include <gtest/gtest.h>

using namespace datastore::transactions;

TEST(Transaction, CtorDefaults)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    ASSERT_EQ(txn.project(), TEST_PROJECT);
    ASSERT_EQ(&txn.client_ref(), &client);
    ASSERT_FALSE(txn.id());
    ASSERT_EQ(txn.status(), unit_of_work_status::NOT_STARTED);
    ASSERT_TRUE(txn.mutations().empty());
    ASSERT_TRUE(txn.partial_key_entities().empty());
}

TEST(Transaction, Current)
{
    recording_api api("678");
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn1(client);
    transaction txn2(client);
    ASSERT_EQ(nullptr, txn1.current());
    ASSERT_EQ(nullptr, txn2.current());
    txn1.run([&](transaction&) {
        ASSERT_EQ(&txn1, txn1.current());
        ASSERT_EQ(&txn1, txn2.current());
        {
            no_commit_batch b(client);
            ASSERT_EQ(nullptr, txn1.current());
            ASSERT_EQ(nullptr, txn2.current());
        }
        txn2.run([&](transaction&) {
            ASSERT_EQ(&txn2, txn1.current());
            ASSERT_EQ(&txn2, txn2.current());
            {
                no_commit_batch b(client);
                ASSERT_EQ(nullptr, txn1.current());
                ASSERT_EQ(nullptr, txn2.current());
            }
        });
        ASSERT_EQ(&txn1, txn1.current());
        ASSERT_EQ(&txn1, txn2.current());
    });
    ASSERT_EQ(nullptr, txn1.current());
    ASSERT_EQ(nullptr, txn2.current());

    ASSERT_TRUE(api.rollbacks.empty());
    ASSERT_EQ(2, api.commits.size());
    for (const auto& call : api.commits) {
        ASSERT_EQ(TEST_PROJECT, call.project);
        ASSERT_EQ(ds::commit_mode::TRANSACTIONAL, call.mode);
        ASSERT_TRUE(call.mutations.empty());
        ASSERT_EQ(std::string("678"), *call.transaction);
    }
}

TEST(Transaction, Begin)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.begin();
    ASSERT_EQ(std::string("234"), *txn.id());
    ASSERT_EQ(unit_of_work_status::IN_PROGRESS, txn.status());
    ASSERT_EQ(std::vector<std::string>{ TEST_PROJECT }, api.begun);
}

TEST(Transaction, BeginTwiceFails)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.begin();
    ASSERT_THROW(txn.begin(), state_error);
    ASSERT_EQ(1, api.begun.size());
    ASSERT_EQ(std::string("234"), *txn.id());
}

TEST(Transaction, BeginTombstoned)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.begin();
    ASSERT_EQ(std::string("234"), *txn.id());

    txn.rollback();
    ASSERT_EQ(1, api.rollbacks.size());
    ASSERT_EQ(TEST_PROJECT, api.rollbacks[0].project);
    ASSERT_EQ("234", api.rollbacks[0].transaction);
    ASSERT_FALSE(txn.id());

    try {
        txn.begin();
        FAIL() << "expected state_error";
    } catch (const state_error& e) {
        ASSERT_EQ(unit_of_work_status::ABORTED, e.status());
    }
    ASSERT_EQ(1, api.begun.size());
}

TEST(Transaction, BeginAfterCommitFails)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.begin();
    txn.commit();
    ASSERT_THROW(txn.begin(), state_error);
}

TEST(Transaction, BeginWithBeginTransactionFailure)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);

    api.begin_error = std::make_exception_ptr(ds::rpc_error(ds::status_code::UNAVAILABLE, "unavailable"));
    ASSERT_THROW(txn.begin(), ds::rpc_error);
    ASSERT_FALSE(txn.id());
    ASSERT_EQ(unit_of_work_status::NOT_STARTED, txn.status());
    ASSERT_EQ(std::vector<std::string>{ TEST_PROJECT }, api.begun);

    // nothing was recorded, so begin can be tried again
    api.begin_error = nullptr;
    txn.begin();
    ASSERT_EQ(std::string("234"), *txn.id());
}

TEST(Transaction, BeginFailurePropagatesOriginalError)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    api.begin_error = std::make_exception_ptr(ds::rpc_error(ds::status_code::PERMISSION_DENIED, "denied"));
    try {
        txn.begin();
        FAIL() << "expected rpc_error";
    } catch (const ds::rpc_error& e) {
        ASSERT_EQ(ds::status_code::PERMISSION_DENIED, e.code());
        ASSERT_STREQ("denied", e.what());
    }
}

TEST(Transaction, Rollback)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.begin();
    ds::entity e(make_key("KIND", 1));
    txn.put(e);
    txn.rollback();
    ASSERT_EQ(1, api.rollbacks.size());
    ASSERT_EQ(TEST_PROJECT, api.rollbacks[0].project);
    ASSERT_EQ("234", api.rollbacks[0].transaction);
    ASSERT_FALSE(txn.id());
    ASSERT_EQ(unit_of_work_status::ABORTED, txn.status());
    ASSERT_TRUE(txn.mutations().empty());
    ASSERT_TRUE(api.commits.empty());
}

TEST(Transaction, RollbackWithoutBeginFails)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    ASSERT_THROW(txn.rollback(), state_error);
    ASSERT_TRUE(api.rollbacks.empty());
}

TEST(Transaction, RollbackFailureStillEndsTransaction)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.begin();
    api.rollback_error = std::make_exception_ptr(ds::rpc_error(ds::status_code::DEADLINE_EXCEEDED, "timeout"));
    ASSERT_THROW(txn.rollback(), ds::rpc_error);
    ASSERT_FALSE(txn.id());
    ASSERT_EQ(unit_of_work_status::ABORTED, txn.status());
    ASSERT_THROW(txn.begin(), state_error);
}

TEST(Transaction, CommitNoPartialKeys)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.begin();
    txn.commit();

    ASSERT_EQ(1, api.commits.size());
    ASSERT_EQ(TEST_PROJECT, api.commits[0].project);
    ASSERT_EQ(ds::commit_mode::TRANSACTIONAL, api.commits[0].mode);
    ASSERT_TRUE(api.commits[0].mutations.empty());
    ASSERT_EQ(std::string("234"), *api.commits[0].transaction);
    ASSERT_FALSE(txn.id());
    ASSERT_EQ(unit_of_work_status::COMMITTED, txn.status());
}

TEST(Transaction, CommitWithCompleteKeysLeavesEntitiesAlone)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.begin();
    ds::entity e(make_key("KIND", 42));
    e.set("name", "complete");
    txn.put(e);
    ASSERT_TRUE(txn.partial_key_entities().empty());
    txn.commit();

    ASSERT_EQ(1, api.commits[0].mutations.size());
    ASSERT_EQ(ds::mutation::upsert(e), api.commits[0].mutations[0]);
    ASSERT_EQ(make_key("KIND", 42), e.key());
}

TEST(Transaction, CommitWithPartialKeys)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    api.response = make_commit_response({ make_key("KIND", 123) });
    transaction txn(client);
    txn.begin();
    ds::entity e(make_partial_key("KIND"));
    txn.put(e);
    ASSERT_EQ(1, txn.partial_key_entities().size());
    ASSERT_EQ(&e, txn.partial_key_entities()[0]);
    auto staged = txn.mutations();
    txn.commit();

    ASSERT_EQ(1, api.commits.size());
    ASSERT_EQ(ds::commit_mode::TRANSACTIONAL, api.commits[0].mode);
    ASSERT_EQ(staged, api.commits[0].mutations);
    ASSERT_EQ(std::string("234"), *api.commits[0].transaction);
    ASSERT_FALSE(txn.id());
    ASSERT_EQ((std::vector<ds::path_element>{ ds::path_element("KIND", 123) }), e.key().path());
    ASSERT_TRUE(txn.partial_key_entities().empty());
}

TEST(Transaction, CommitPatchesPartialKeysInStagingOrder)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.begin();

    ds::entity a(make_partial_key("A"));
    ds::entity complete(make_key("C", 7));
    ds::entity b(make_partial_key("B"));
    txn.put(a);
    txn.put(complete);
    txn.remove(make_key("D", 8));
    txn.put(b);
    ASSERT_EQ(4, txn.mutations().size());
    ASSERT_EQ((std::vector<ds::entity*>{ &a, &b }), txn.partial_key_entities());

    // the server only reports keys for the mutations that needed one
    ds::commit_response response;
    response.mutation_results.resize(4);
    response.mutation_results[0].key = make_key("A", 1001);
    response.mutation_results[3].key = make_key("B", 1002);
    api.response = response;
    txn.commit();

    ASSERT_EQ(make_key("A", 1001), a.key());
    ASSERT_EQ(make_key("B", 1002), b.key());
    ASSERT_EQ(make_key("C", 7), complete.key());
}

TEST(Transaction, CommitWithMismatchedKeyCount)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    api.response = make_commit_response({ make_key("KIND", 1), make_key("KIND", 2) });
    transaction txn(client);
    txn.begin();
    ds::entity e(make_partial_key("KIND"));
    txn.put(e);
    try {
        txn.commit();
        FAIL() << "expected invalid_commit_response";
    } catch (const invalid_commit_response& err) {
        ASSERT_EQ(1, err.expected());
        ASSERT_EQ(2, err.received());
    }
    // the server committed, so the transaction is over, but no entity was guessed at
    ASSERT_FALSE(txn.id());
    ASSERT_EQ(unit_of_work_status::COMMITTED, txn.status());
    ASSERT_TRUE(e.key().is_partial());
}

TEST(Transaction, CommitWithoutBeginFails)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    ASSERT_THROW(txn.commit(), state_error);
    ASSERT_TRUE(api.commits.empty());
}

TEST(Transaction, CommitFailureLeavesStateUntouched)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.begin();
    ds::entity e(make_partial_key("KIND"));
    txn.put(e);
    api.commit_error = std::make_exception_ptr(ds::rpc_error(ds::status_code::ABORTED, "contention"));

    ASSERT_THROW(txn.commit(), ds::rpc_error);
    ASSERT_EQ(std::string("234"), *txn.id());
    ASSERT_EQ(unit_of_work_status::IN_PROGRESS, txn.status());
    ASSERT_EQ(1, txn.mutations().size());
    ASSERT_EQ(1, txn.partial_key_entities().size());

    // a second commit is the caller's call, and sends the same mutations
    api.commit_error = nullptr;
    api.response = make_commit_response({ make_key("KIND", 5) });
    txn.commit();
    ASSERT_EQ(2, api.commits.size());
    ASSERT_EQ(api.commits[0].mutations, api.commits[1].mutations);
    ASSERT_EQ(make_key("KIND", 5), e.key());
}

TEST(Transaction, RunNoRaise)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    txn.run([&](transaction& t) {
        ASSERT_EQ(&txn, &t);
        ASSERT_EQ(std::string("234"), *txn.id());
        ASSERT_EQ(std::vector<std::string>{ TEST_PROJECT }, api.begun);
        ASSERT_EQ(&txn, client.current_transaction());
    });

    ASSERT_EQ(1, api.begun.size());
    ASSERT_EQ(1, api.commits.size());
    ASSERT_EQ(ds::commit_mode::TRANSACTIONAL, api.commits[0].mode);
    ASSERT_TRUE(api.commits[0].mutations.empty());
    ASSERT_EQ(std::string("234"), *api.commits[0].transaction);
    ASSERT_TRUE(api.rollbacks.empty());
    ASSERT_FALSE(txn.id());
    ASSERT_TRUE(client.stack().empty());
}

TEST(Transaction, RunWithRaise)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    ds::entity e(make_key("KIND", 1));
    try {
        txn.run([&](transaction& t) {
            ASSERT_EQ(std::string("234"), *txn.id());
            t.put(e);
            throw test_failure("boom");
        });
        FAIL() << "expected test_failure";
    } catch (const test_failure& err) {
        ASSERT_STREQ("boom", err.what());
        ASSERT_FALSE(txn.id());
        ASSERT_EQ(1, api.rollbacks.size());
        ASSERT_EQ(TEST_PROJECT, api.rollbacks[0].project);
        ASSERT_EQ("234", api.rollbacks[0].transaction);
    }
    ASSERT_TRUE(api.commits.empty());
    ASSERT_FALSE(txn.id());
    ASSERT_EQ(unit_of_work_status::ABORTED, txn.status());
    ASSERT_TRUE(client.stack().empty());
}

TEST(Transaction, RunWithNonStandardException)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    transaction txn(client);
    ASSERT_THROW(txn.run([](transaction&) { throw 3; }), int);
    ASSERT_EQ(1, api.rollbacks.size());
    ASSERT_TRUE(api.commits.empty());
    ASSERT_TRUE(client.stack().empty());
}

TEST(Transaction, RunRollbackFailureKeepsOriginalError)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    api.rollback_error = std::make_exception_ptr(ds::rpc_error(ds::status_code::UNAVAILABLE, "rollback failed"));
    transaction txn(client);
    try {
        txn.run([](transaction&) { throw test_failure("original"); });
        FAIL() << "expected test_failure";
    } catch (const test_failure& err) {
        ASSERT_STREQ("original", err.what());
    }
    ASSERT_EQ(1, api.rollbacks.size());
    ASSERT_FALSE(txn.id());
    ASSERT_TRUE(client.stack().empty());
}

TEST(Transaction, RunNonStandardRollbackFailureKeepsOriginalError)
{
    struct transport_failure {
    };
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    api.rollback_error = std::make_exception_ptr(transport_failure{});
    transaction txn(client);
    try {
        txn.run([](transaction&) { throw test_failure("original"); });
        FAIL() << "expected test_failure";
    } catch (const test_failure& err) {
        ASSERT_STREQ("original", err.what());
    } catch (const transport_failure&) {
        FAIL() << "rollback error replaced the logic error";
    }
    ASSERT_EQ(1, api.rollbacks.size());
    ASSERT_EQ(unit_of_work_status::ABORTED, txn.status());
    ASSERT_TRUE(client.stack().empty());
}

TEST(Transaction, RunThroughBatchReferenceReadsInTransaction)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    std::unique_ptr<batch> unit = client.new_transaction();
    transaction* seen = nullptr;
    unit->run([&](batch&) {
        seen = client.current_transaction();
        (void)client.get(make_key("Task", 1));
    });
    ASSERT_EQ(unit.get(), seen);
    ASSERT_EQ(1, api.lookups.size());
    ASSERT_EQ(std::string("234"), *api.lookups[0].transaction);
    ASSERT_EQ(1, api.commits.size());
    ASSERT_EQ(ds::commit_mode::TRANSACTIONAL, api.commits[0].mode);
}

TEST(Transaction, RunBeginFailurePopsStack)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    api.begin_error = std::make_exception_ptr(ds::rpc_error(ds::status_code::UNAVAILABLE, "no begin"));
    transaction txn(client);
    bool called = false;
    ASSERT_THROW(txn.run([&](transaction&) { called = true; }), ds::rpc_error);
    ASSERT_FALSE(called);
    ASSERT_TRUE(api.rollbacks.empty());
    ASSERT_TRUE(api.commits.empty());
    ASSERT_TRUE(client.stack().empty());
}

TEST(Transaction, RunCommitFailurePopsStack)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    api.commit_error = std::make_exception_ptr(ds::rpc_error(ds::status_code::ABORTED, "conflict"));
    transaction txn(client);
    ASSERT_THROW(txn.run([](transaction&) {}), ds::rpc_error);
    ASSERT_EQ(1, api.commits.size());
    ASSERT_TRUE(api.rollbacks.empty());
    ASSERT_TRUE(client.stack().empty());
    // left in progress, the caller decides whether to retry or roll back
    ASSERT_EQ(unit_of_work_status::IN_PROGRESS, txn.status());
    txn.rollback();
    ASSERT_EQ(1, api.rollbacks.size());
}

TEST(Transaction, RunStagesClientWrites)
{
    recording_api api;
    ds::client client(ds::client_config(TEST_PROJECT), api);
    api.response = make_commit_response({ make_key("Task", 99) });
    transaction txn(client);
    ds::entity task(client.key({ ds::path_element("Task") }));
    txn.run([&](transaction&) {
        client.put(task);
        client.remove(make_key("Task", 1));
        ASSERT_TRUE(api.commits.empty());
        ASSERT_EQ(2, txn.mutations().size());
    });
    ASSERT_EQ(1, api.commits.size());
    ASSERT_EQ(ds::mutation_type::UPSERT, api.commits[0].mutations[0].type());
    ASSERT_EQ(ds::mutation_type::REMOVE, api.commits[0].mutations[1].type());
    ASSERT_EQ(make_key("Task", 99), task.key());
}
