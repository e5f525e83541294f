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

#include "logging.hxx"
#include <datastore/transactions/batch.hxx>
#include <datastore/transactions/transaction.hxx>
#include <datastore/transactions/unit_of_work_stack.hxx>

#include <stdexcept>

namespace tx = datastore::transactions;

namespace
{
struct as_batch {
    tx::batch* operator()(tx::batch* b) const
    {
        return b;
    }
    tx::batch* operator()(tx::transaction* txn) const
    {
        return txn;
    }
};
} // namespace

void
tx::unit_of_work_stack::push(batch& unit)
{
    entries_.push_back(unit.stack_entry());
}

tx::batch*
tx::unit_of_work_stack::pop()
{
    if (entries_.empty()) {
        throw std::out_of_range("no unit of work to pop");
    }
    auto* top = std::visit(as_batch{}, entries_.back());
    entries_.pop_back();
    return top;
}

tx::batch*
tx::unit_of_work_stack::current_batch() const
{
    if (entries_.empty()) {
        return nullptr;
    }
    return std::visit(as_batch{}, entries_.back());
}

tx::transaction*
tx::unit_of_work_stack::current_transaction() const
{
    if (entries_.empty()) {
        return nullptr;
    }
    if (auto* txn = std::get_if<transaction*>(&entries_.back())) {
        return *txn;
    }
    return nullptr;
}

tx::unit_of_work_scope::unit_of_work_scope(unit_of_work_stack& stack, batch& unit)
  : stack_(stack)
  , unit_(&unit)
  , depth_(stack.depth())
{
    stack_.push(unit);
}

tx::unit_of_work_scope::~unit_of_work_scope()
{
    if (stack_.depth() <= depth_) {
        txn_log->error("unit of work was already removed from the stack (depth {}, expected {})", stack_.depth(), depth_ + 1);
        return;
    }
    if (stack_.current_batch() != unit_) {
        txn_log->error("unit of work stack was left with {} extra entries, unwinding them", stack_.depth() - depth_ - 1);
    }
    while (stack_.depth() > depth_) {
        stack_.pop();
    }
}
