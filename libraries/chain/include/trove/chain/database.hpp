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

#include <trove/chain/collectible_object.hpp>
#include <trove/chain/evaluator.hpp>
#include <trove/chain/exceptions.hpp>
#include <trove/chain/host_interfaces.hpp>
#include <trove/protocol/chain_parameters.hpp>
#include <trove/protocol/operations.hpp>

#include <fc/signals.hpp>

#include <memory>
#include <tuple>
#include <utility>
#include <vector>

namespace trove {
   namespace chain {
      using namespace trove::protocol;

      /**
       *  @class database
       *  @brief Tracks the state of the collectible registry
       *
       *  Operations are applied one at a time.  An operation either commits entirely and deposits
       *  exactly one event, or throws and leaves both the registry and the event list untouched.
       *  The database takes no locks; the host serializes every call.
       */
      class database {
      public:
         /**
          * @param params Registry parameters, fixed for the lifetime of the database
          * @param settlement Monetary transfer primitive used by buy
          * @param entropy Randomness consumed by mint
          * @param sequence Operation position consumed by mint; advanced by the host
          */
         database(const chain_parameters &params,
                  settlement_interface &settlement,
                  const entropy_source &entropy,
                  const sequence_provider &sequence);

         ~database();

         database(const database &) = delete;
         database &operator=(const database &) = delete;

         /**
          * Validate and apply an operation on behalf of its fee payer
          * @return The new collectible ID for a mint, void_result otherwise
          */
         operation_result apply_operation(const operation &op);

         /**
          *  This signal is emitted after an operation commits, once per deposited event.
          */
         fc::signal<void(const collectible_event &)> applied_event;

         //////////////////// db_getter.cpp ////////////////////

         const chain_parameters &get_chain_parameters() const;

         const collectible_object *find_collectible(const collectible_id_type &id) const;

         /// @throws no_collectible
         const collectible_object &get_collectible(const collectible_id_type &id) const;

         /// IDs held by an account, in no particular order
         vector<collectible_id_type> get_collectibles_owned_by(account_id_type account) const;

         const collectible_holdings_object *find_holdings(account_id_type account) const;

         uint64_t get_collectible_count() const;

         const registry_properties_object &get_registry_properties() const;

         const vector<collectible_event> &get_applied_events() const;

         void clear_applied_events();

         //////////////////// collaborators ////////////////////

         settlement_interface &settlement() const { return _settlement; }

         const entropy_source &entropy() const { return _entropy; }

         const sequence_provider &sequence() const { return _sequence; }

         //////////////////// object storage ////////////////////

         template<typename IndexType>
         const IndexType &get_index_type() const {
            return std::get<IndexType>(_indices);
         }

         template<typename ObjectType, typename Constructor>
         const ObjectType &create(Constructor &&constructor) {
            return std::get<typename object_index_of<ObjectType>::type>(_indices)
               .create(std::forward<Constructor>(constructor));
         }

         template<typename ObjectType, typename Modifier>
         void modify(const ObjectType &obj, Modifier &&m) {
            std::get<typename object_index_of<ObjectType>::type>(_indices)
               .modify(obj, std::forward<Modifier>(m));
         }

         template<typename Modifier>
         void modify(const registry_properties_object &obj, Modifier &&m) {
            FC_ASSERT(&obj == &_registry_properties, "Unknown registry properties object");
            m(_registry_properties);
         }

         template<typename ObjectType>
         void remove(const ObjectType &obj) {
            std::get<typename object_index_of<ObjectType>::type>(_indices).remove(obj);
         }

         /// Record an event of the operation being applied and publish it
         void push_applied_event(const collectible_event &event);

      private:
         template<typename EvaluatorType>
         void register_evaluator() {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset(
               new op_evaluator_impl<EvaluatorType>());
         }

         void initialize_evaluators();

         const chain_parameters _parameters;
         settlement_interface &_settlement;
         const entropy_source &_entropy;
         const sequence_provider &_sequence;

         std::tuple<collectible_index, collectible_holdings_index> _indices;
         registry_properties_object _registry_properties;

         vector<collectible_event> _applied_events;

         vector<std::unique_ptr<op_evaluator>> _operation_evaluators;
      };

   }
} // trove::chain
