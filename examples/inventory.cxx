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

#include <datastore/transactions.hxx>

#include <iostream>
#include <string>

using namespace std;
using namespace datastore;

class Shop
{
  private:
    client& client_;

  public:
    explicit Shop(client& client)
      : client_(client)
    {
    }

    entity new_item(const string& name, int quantity, int price)
    {
        entity item(client_.key({ path_element("Item") }));
        item.set("name", name);
        item.set("quantity", quantity);
        item.set("price", price);
        return item;
    }

    void buy(const key& item_key, const string& customer, int quantity)
    {
        entity order(client_.key({ path_element("Order") }));
        client_.new_transaction()->run([&](transactions::transaction& txn) {
            auto item = client_.get(item_key);
            if (!item) {
                throw runtime_error("no such item " + item_key.to_string());
            }
            int in_stock = item->get<int>("quantity");
            if (in_stock < quantity) {
                throw runtime_error("only " + to_string(in_stock) + " left of " + item->get<string>("name"));
            }
            item->set("quantity", in_stock - quantity);
            txn.put(*item);

            order.set("customer", customer);
            order.set("item", item->get<string>("name"));
            order.set("quantity", quantity);
            order.set("total", quantity * item->get<int>("price"));
            txn.put(order);

            cout << "About to commit order for " << customer << endl;
        });
        // the order's key was allocated by the commit
        cout << "Placed " << order.key() << endl;
    }
};

int main(int, const char*[])
{
    in_memory_api store;
    client db(client_config("inventory-demo").log_level(log_level::INFO), store);
    Shop shop(db);

    auto lamp = shop.new_item("lamp", 3, 40);
    auto rug = shop.new_item("rug", 1, 120);
    db.new_batch()->run([&](transactions::batch& batch) {
        batch.put(lamp);
        batch.put(rug);
    });
    cout << "Stocked " << lamp.key() << " and " << rug.key() << endl;

    shop.buy(lamp.key(), "alice", 2);
    try {
        shop.buy(rug.key(), "bob", 2);
    } catch (const runtime_error& e) {
        cout << "Order rejected, transaction rolled back: " << e.what() << endl;
    }

    auto stored = db.get(lamp.key());
    cout << "lamps left: " << stored->get<int>("quantity") << ", entities stored: " << store.size() << endl;
    return 0;
}
