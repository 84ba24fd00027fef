/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include "database_fixture.hpp"

#include <fc/scoped_exit.hpp>

#include <exception>
#include <map>

namespace trove {
   namespace chain {
      namespace test {

         database_fixture::database_fixture(const chain_parameters &p)
            : params(p), entropy("trove-test"), db(params, ledger, entropy, sequence) {
         }

         database_fixture::~database_fixture() {
            try {
               if (!skip_invariant_check && std::uncaught_exceptions() == 0)
                  verify_registry_invariants();
            } catch (const fc::exception &e) {
               BOOST_ERROR(e.to_detail_string());
            }
         }

         chain_parameters database_fixture::default_parameters() {
            return chain_parameters();
         }

         chain_parameters database_fixture::parameters_with_maximum_owned(uint32_t maximum_owned) {
            chain_parameters p;
            p.maximum_owned = maximum_owned;
            return p;
         }

         account_id_type database_fixture::create_account(const std::string &name) {
            const account_id_type id(_next_account++);
            dlog("Test account ${name} is ${id}", ("name", name)("id", id));
            return id;
         }

         void database_fixture::fund(account_id_type account, share_type amount) {
            ledger.adjust_balance(account, amount);
         }

         operation_result database_fixture::push_op(const operation &op) {
            auto advance = fc::make_scoped_exit([this]() { sequence.next_operation(); });
            return db.apply_operation(op);
         }

         void database_fixture::generate_block() {
            sequence.generate_block();
         }

         collectible_id_type database_fixture::mint(account_id_type owner) {
            collectible_create_operation op;
            op.owner = owner;
            return push_op(op).get<collectible_id_type>();
         }

         void database_fixture::destroy(account_id_type owner, const collectible_id_type &id) {
            collectible_destroy_operation op;
            op.owner = owner;
            op.collectible = id;
            push_op(op);
         }

         void database_fixture::transfer(account_id_type from, account_id_type to, const collectible_id_type &id) {
            collectible_transfer_operation op;
            op.from = from;
            op.to = to;
            op.collectible = id;
            push_op(op);
         }

         void database_fixture::set_price(account_id_type owner, const collectible_id_type &id, share_type price) {
            collectible_set_price_operation op;
            op.owner = owner;
            op.collectible = id;
            op.price = price;
            push_op(op);
         }

         void database_fixture::remove_from_market(account_id_type owner, const collectible_id_type &id) {
            collectible_remove_from_market_operation op;
            op.owner = owner;
            op.collectible = id;
            push_op(op);
         }

         void database_fixture::buy(account_id_type buyer, const collectible_id_type &id, share_type offered_price) {
            collectible_buy_operation op;
            op.buyer = buyer;
            op.collectible = id;
            op.offered_price = offered_price;
            push_op(op);
         }

         size_t database_fixture::held_by(account_id_type account) const {
            return db.get_collectibles_owned_by(account).size();
         }

         void database_fixture::verify_registry_invariants() const {
            const auto &collectibles = db.get_index_type<collectible_index>().indices();
            const auto &holdings = db.get_index_type<collectible_holdings_index>().indices();

            BOOST_CHECK_EQUAL(db.get_collectible_count(), collectibles.size());

            std::map<collectible_id_type, account_id_type> listed_under;
            for (const collectible_holdings_object &h : holdings) {
               BOOST_CHECK_LE(h.collectibles.size(), db.get_chain_parameters().maximum_owned);
               for (const collectible_id_type &id : h.collectibles) {
                  BOOST_CHECK_MESSAGE(listed_under.emplace(id, h.owner).second,
                                      "Collectible " << id.str() << " is listed more than once");

                  const collectible_object *c = db.find_collectible(id);
                  BOOST_CHECK_MESSAGE(c != nullptr, "Holdings list unknown collectible " << id.str());
                  if (c != nullptr)
                     BOOST_CHECK_MESSAGE(c->owner == h.owner,
                                         "Collectible " << id.str() << " is listed under the wrong account");
               }
            }

            BOOST_CHECK_EQUAL(listed_under.size(), collectibles.size());
            for (const collectible_object &c : collectibles) {
               BOOST_CHECK_MESSAGE(listed_under.count(c.collectible_id) == 1,
                                   "Collectible " << c.collectible_id.str() << " is missing from its owner's holdings");
            }
         }

      }
   }
} // trove::chain::test
