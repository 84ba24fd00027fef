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
#include <trove/chain/collectible_evaluator.hpp>
#include <trove/chain/database.hpp>
#include <trove/chain/exceptions.hpp>

#include <limits>
#include <utility>

namespace trove {
   namespace chain {

      void_result collectible_create_evaluator::do_evaluate(const collectible_create_operation &op) {
         try {
            const database &d = db();

            unique_id_payload payload;
            payload.random = d.entropy().random(TROVE_UNIQUE_ID_DOMAIN);
            payload.op_index = d.sequence().current_op_index();
            payload.block_num = d.sequence().head_block_num();
            _generated = generate_unique_id(payload);

            TROVE_ASSERT(d.find_collectible(_generated.id) == nullptr, duplicate_collectible,
                         "Collectible ${id} already exists", ("id", _generated.id));

            const uint64_t count = d.get_collectible_count();
            TROVE_ASSERT(count < std::numeric_limits<uint64_t>::max(), bounds_overflow,
                         "The number of collectibles cannot exceed ${count}", ("count", count));
            _new_count = count + 1;

            collectible_holdings_object staged;
            staged.owner = op.owner;
            _ptr_holdings = d.find_holdings(op.owner);
            if (_ptr_holdings) {
               staged.collectibles = _ptr_holdings->collectibles;
            }
            const uint32_t maximum_owned = d.get_chain_parameters().maximum_owned;
            TROVE_ASSERT(staged.try_append(_generated.id, maximum_owned), maximum_collectibles_owned,
                         "Account ${a} already holds the maximum of ${max} collectibles",
                         ("a", op.owner)("max", maximum_owned));
            _collectibles = std::move(staged.collectibles);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      collectible_id_type collectible_create_evaluator::do_apply(const collectible_create_operation &op) {
         try {
            database &d = db();

            d.modify(d.get_registry_properties(), [this](registry_properties_object &p) {
               p.collectible_count = _new_count;
            });

            if (_ptr_holdings) {
               d.modify(*_ptr_holdings, [this](collectible_holdings_object &h) {
                  h.collectibles = _collectibles;
               });
            } else {
               d.create<collectible_holdings_object>([this, &op](collectible_holdings_object &h) {
                  h.owner = op.owner;
                  h.collectibles = _collectibles;
               });
            }

            d.create<collectible_object>([this, &op](collectible_object &c) {
               c.collectible_id = _generated.id;
               c.owner = op.owner;
               c.attribute = _generated.attribute;
            });

            d.push_applied_event(collectible_created_event(_generated.id, op.owner));

            return _generated.id;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collectible_destroy_evaluator::do_evaluate(const collectible_destroy_operation &op) {
         try {
            const database &d = db();

            _ptr_collectible = &get_owned_collectible(d, op.collectible, op.owner);

            _ptr_holdings = d.find_holdings(op.owner);
            FC_ASSERT(_ptr_holdings, "Holdings of ${a} are missing", ("a", op.owner));
            collectible_holdings_object staged = *_ptr_holdings;
            FC_ASSERT(staged.swap_remove(op.collectible),
                      "Holdings of ${a} do not list ${id}", ("a", op.owner)("id", op.collectible));
            _remaining = std::move(staged.collectibles);

            FC_ASSERT(d.get_collectible_count() > 0, "Collectible count underflow");

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collectible_destroy_evaluator::do_apply(const collectible_destroy_operation &op) {
         try {
            database &d = db();

            d.modify(d.get_registry_properties(), [](registry_properties_object &p) {
               p.collectible_count -= 1;
            });

            d.modify(*_ptr_holdings, [this](collectible_holdings_object &h) {
               h.collectibles = _remaining;
            });

            d.remove(*_ptr_collectible);

            d.push_applied_event(collectible_destroyed_event(op.collectible));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collectible_transfer_evaluator::do_evaluate(const collectible_transfer_operation &op) {
         try {
            const database &d = db();

            const collectible_object &collectible = get_owned_collectible(d, op.collectible, op.from);
            _pending = evaluate_collectible_transfer(d, collectible, op.to);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collectible_transfer_evaluator::do_apply(const collectible_transfer_operation &op) {
         try {
            database &d = db();

            apply_collectible_transfer(d, _pending);

            d.push_applied_event(transfer_succeeded_event(op.from, op.to, op.collectible));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collectible_set_price_evaluator::do_evaluate(const collectible_set_price_operation &op) {
         try {
            _ptr_collectible = &get_owned_collectible(db(), op.collectible, op.owner);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collectible_set_price_evaluator::do_apply(const collectible_set_price_operation &op) {
         try {
            database &d = db();

            d.modify(*_ptr_collectible, [&op](collectible_object &c) {
               c.price = op.price;
            });

            d.push_applied_event(price_set_event(op.collectible, op.price));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collectible_remove_from_market_evaluator::do_evaluate(
            const collectible_remove_from_market_operation &op) {
         try {
            _ptr_collectible = &get_owned_collectible(db(), op.collectible, op.owner);

            TROVE_ASSERT(_ptr_collectible->is_for_sale(), collectible_not_for_sale,
                         "Collectible ${id} is not on sale", ("id", op.collectible));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collectible_remove_from_market_evaluator::do_apply(
            const collectible_remove_from_market_operation &op) {
         try {
            database &d = db();

            d.modify(*_ptr_collectible, [](collectible_object &c) {
               c.price.reset();
            });

            d.push_applied_event(not_longer_on_sale_event(op.collectible));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collectible_buy_evaluator::do_evaluate(const collectible_buy_operation &op) {
         try {
            const database &d = db();

            const collectible_object &collectible = d.get_collectible(op.collectible);

            TROVE_ASSERT(collectible.is_for_sale(), collectible_not_for_sale,
                         "Collectible ${id} is not on sale", ("id", op.collectible));
            _listed_price = *collectible.price;

            TROVE_ASSERT(op.offered_price >= _listed_price, offered_price_too_low,
                         "Offered ${offered} for collectible ${id} listed at ${price}",
                         ("offered", op.offered_price)("id", op.collectible)("price", _listed_price));

            _pending = evaluate_collectible_transfer(d, collectible, op.buyer);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collectible_buy_evaluator::do_apply(const collectible_buy_operation &op) {
         try {
            database &d = db();

            // Settle first: a failed payment must leave the registry untouched
            d.settlement().transfer(op.buyer, _pending.from, _listed_price);

            apply_collectible_transfer(d, _pending);

            d.push_applied_event(sold_event(_pending.from, op.buyer, op.collectible, _listed_price));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      const collectible_object &get_owned_collectible(const database &db,
                                                      const collectible_id_type &id,
                                                      const account_id_type &caller) {
         const collectible_object &collectible = db.get_collectible(id);
         TROVE_ASSERT(collectible.owner == caller, not_owner,
                      "Account ${caller} does not own collectible ${id}",
                      ("caller", caller)("id", id));
         return collectible;
      }

      const pending_collectible_transfer evaluate_collectible_transfer(const database &db,
                                                                       const collectible_object &collectible,
                                                                       const account_id_type &to) {
         pending_collectible_transfer ptx;
         ptx.ptr_collectible = &collectible;
         ptx.from = collectible.owner;
         ptx.to = to;

         TROVE_ASSERT(ptx.from != ptx.to, transfer_to_self,
                      "Account ${a} cannot transfer collectible ${id} to itself",
                      ("a", ptx.from)("id", collectible.collectible_id));

         // From
         ptx.ptr_from_holdings = db.find_holdings(ptx.from);
         FC_ASSERT(ptx.ptr_from_holdings, "Holdings of ${a} are missing", ("a", ptx.from));
         collectible_holdings_object staged_from = *ptx.ptr_from_holdings;
         FC_ASSERT(staged_from.swap_remove(collectible.collectible_id),
                   "Holdings of ${a} do not list ${id}", ("a", ptx.from)("id", collectible.collectible_id));
         ptx.from_collectibles = std::move(staged_from.collectibles);

         // To
         collectible_holdings_object staged_to;
         staged_to.owner = to;
         ptx.ptr_to_holdings = db.find_holdings(to);
         if (ptx.ptr_to_holdings) {
            staged_to.collectibles = ptx.ptr_to_holdings->collectibles;
         }
         const uint32_t maximum_owned = db.get_chain_parameters().maximum_owned;
         TROVE_ASSERT(staged_to.try_append(collectible.collectible_id, maximum_owned), maximum_collectibles_owned,
                      "Account ${a} already holds the maximum of ${max} collectibles",
                      ("a", to)("max", maximum_owned));
         ptx.to_collectibles = std::move(staged_to.collectibles);

         return ptx;
      }

      void apply_collectible_transfer(database &db, const pending_collectible_transfer &ptx) {
         db.modify(*ptx.ptr_collectible, [&ptx](collectible_object &c) {
            c.owner = ptx.to;
            c.price.reset();
         });

         db.modify(*ptx.ptr_from_holdings, [&ptx](collectible_holdings_object &h) {
            h.collectibles = ptx.from_collectibles;
         });

         if (ptx.ptr_to_holdings) {
            db.modify(*ptx.ptr_to_holdings, [&ptx](collectible_holdings_object &h) {
               h.collectibles = ptx.to_collectibles;
            });
         } else {
            db.create<collectible_holdings_object>([&ptx](collectible_holdings_object &h) {
               h.owner = ptx.to;
               h.collectibles = ptx.to_collectibles;
            });
         }
      }

   }
} // trove::chain
