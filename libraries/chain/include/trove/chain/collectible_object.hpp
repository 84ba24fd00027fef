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
#include <trove/chain/generic_index.hpp>
#include <trove/protocol/types.hpp>

/**
 * @defgroup collectible Collectible registry objects
 */

namespace trove {
   namespace chain {
      using namespace trove::protocol;

      /**
       *  @brief Tracks a collectible
       *  @ingroup object
       *
       *  The registry exclusively owns this object.  Every other structure refers to it by its ID.
       */
      class collectible_object {
      public:
         /// Unique identifier of the collectible
         collectible_id_type collectible_id;

         /// Current owner
         account_id_type owner;

         /// Asking price.  Not set when the collectible is not for sale.
         optional<share_type> price;

         collectible_attribute attribute = collectible_attribute::red;

         bool is_for_sale() const { return price.valid(); }
      };

      struct by_collectible_id;
      typedef multi_index_container<
         collectible_object,
         indexed_by<
            ordered_unique< tag<by_collectible_id>,
               member<collectible_object, collectible_id_type, &collectible_object::collectible_id> >
         >
      > collectible_multi_index_type;
      typedef generic_index<collectible_object, collectible_multi_index_type> collectible_index;


      /**
       *  @brief Tracks the collectibles held by an account
       *  @ingroup object
       *
       *  A reverse index only: it holds IDs, never the collectibles themselves.
       *  The order of the IDs carries no meaning and changes on removal.
       */
      class collectible_holdings_object {
      public:
         account_id_type owner;

         vector<collectible_id_type> collectibles;

         /**
          * Append an ID unless the holdings are already at the bound
          * @param id Collectible ID
          * @param maximum_owned Bound on the number of IDs
          * @return False when the bound would be exceeded, in which case nothing changes
          */
         bool try_append(const collectible_id_type &id, uint32_t maximum_owned);

         /**
          * Remove an ID by moving the last ID into its slot
          * @param id Collectible ID
          * @return False when the ID was not held
          */
         bool swap_remove(const collectible_id_type &id);

         bool holds(const collectible_id_type &id) const;
      };

      struct by_owner;
      typedef multi_index_container<
         collectible_holdings_object,
         indexed_by<
            ordered_unique< tag<by_owner>,
               member<collectible_holdings_object, account_id_type, &collectible_holdings_object::owner> >
         >
      > collectible_holdings_multi_index_type;
      typedef generic_index<collectible_holdings_object, collectible_holdings_multi_index_type> collectible_holdings_index;


      /**
       *  @brief Registry-wide counters
       *  @ingroup object
       *
       *  collectible_count always equals the number of collectible_object instances.
       */
      class registry_properties_object {
      public:
         uint64_t collectible_count = 0;
      };

   }
} // trove::chain

TROVE_MAP_OBJECT_TO_INDEX(trove::chain::collectible_object, trove::chain::collectible_index)
TROVE_MAP_OBJECT_TO_INDEX(trove::chain::collectible_holdings_object, trove::chain::collectible_holdings_index)

FC_REFLECT( trove::chain::collectible_object,
            (collectible_id)
            (owner)
            (price)
            (attribute)
          )

FC_REFLECT( trove::chain::collectible_holdings_object, (owner)(collectibles) )

FC_REFLECT( trove::chain::registry_properties_object, (collectible_count) )
