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
#pragma once

#include <trove/chain/evaluator.hpp>
#include <trove/chain/collectible_object.hpp>
#include <trove/chain/unique_id_generator.hpp>
#include <trove/protocol/collectible.hpp>

namespace trove {
   namespace chain {

      class collectible_create_evaluator : public evaluator<collectible_create_evaluator> {
      public:
         typedef collectible_create_operation operation_type;

         void_result do_evaluate(const collectible_create_operation &o);

         collectible_id_type do_apply(const collectible_create_operation &o);

         generated_unique_id _generated;
         uint64_t _new_count = 0;
         const collectible_holdings_object* _ptr_holdings = nullptr;
         vector<collectible_id_type> _collectibles;
      };

      class collectible_destroy_evaluator : public evaluator<collectible_destroy_evaluator> {
      public:
         typedef collectible_destroy_operation operation_type;

         void_result do_evaluate(const collectible_destroy_operation &o);

         void_result do_apply(const collectible_destroy_operation &o);

         const collectible_object* _ptr_collectible = nullptr;
         const collectible_holdings_object* _ptr_holdings = nullptr;
         vector<collectible_id_type> _remaining;
      };

      class pending_collectible_transfer {
      public:
         /// The collectible being moved
         const collectible_object* ptr_collectible = nullptr;

         account_id_type from;
         account_id_type to;

         /// Holdings of the sender and the content they will have afterwards
         const collectible_holdings_object* ptr_from_holdings = nullptr;
         vector<collectible_id_type> from_collectibles;

         /// Holdings of the recipient, or null when the recipient has never held a collectible
         const collectible_holdings_object* ptr_to_holdings = nullptr;
         vector<collectible_id_type> to_collectibles;
      };

      class collectible_transfer_evaluator : public evaluator<collectible_transfer_evaluator> {
      public:
         typedef collectible_transfer_operation operation_type;

         void_result do_evaluate(const collectible_transfer_operation &o);

         void_result do_apply(const collectible_transfer_operation &o);

         pending_collectible_transfer _pending;
      };

      class collectible_set_price_evaluator : public evaluator<collectible_set_price_evaluator> {
      public:
         typedef collectible_set_price_operation operation_type;

         void_result do_evaluate(const collectible_set_price_operation &o);

         void_result do_apply(const collectible_set_price_operation &o);

         const collectible_object* _ptr_collectible = nullptr;
      };

      class collectible_remove_from_market_evaluator : public evaluator<collectible_remove_from_market_evaluator> {
      public:
         typedef collectible_remove_from_market_operation operation_type;

         void_result do_evaluate(const collectible_remove_from_market_operation &o);

         void_result do_apply(const collectible_remove_from_market_operation &o);

         const collectible_object* _ptr_collectible = nullptr;
      };

      class collectible_buy_evaluator : public evaluator<collectible_buy_evaluator> {
      public:
         typedef collectible_buy_operation operation_type;

         void_result do_evaluate(const collectible_buy_operation &o);

         void_result do_apply(const collectible_buy_operation &o);

         pending_collectible_transfer _pending;
         share_type _listed_price;
      };

      /**
       * Look up a collectible and check that an account owns it
       * @param db Database
       * @param id Collectible ID
       * @param caller Account that claims ownership
       * @return The collectible
       * @throws no_collectible, not_owner
       */
      const collectible_object &get_owned_collectible(const database &db,
                                                      const collectible_id_type &id,
                                                      const account_id_type &caller);

      /**
       * Stage the change of ownership of a collectible without modifying the database
       * @param db Database
       * @param collectible The collectible to move
       * @param to Recipient
       * @return Pending transfer
       * @throws transfer_to_self, maximum_collectibles_owned
       */
      const pending_collectible_transfer evaluate_collectible_transfer(const database &db,
                                                                       const collectible_object &collectible,
                                                                       const account_id_type &to);

      /**
       * Apply a previously evaluated pending transfer.  The collectible leaves the market.
       * @param db Database
       * @param ptx Pending transfer
       */
      void apply_collectible_transfer(database &db, const pending_collectible_transfer &ptx);

   }
} // trove::chain
