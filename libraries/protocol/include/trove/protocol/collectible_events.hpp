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

#include <trove/protocol/types.hpp>

/**
 * Outcome records.  Exactly one is deposited for every operation that succeeds.
 */
namespace trove {
   namespace protocol {
      struct collectible_created_event {
         collectible_created_event() {}
         collectible_created_event(const collectible_id_type &id, account_id_type owner)
            : collectible(id), owner(owner) {}

         collectible_id_type collectible;
         account_id_type owner;
      };

      struct collectible_destroyed_event {
         collectible_destroyed_event() {}
         explicit collectible_destroyed_event(const collectible_id_type &id)
            : collectible(id) {}

         collectible_id_type collectible;
      };

      struct transfer_succeeded_event {
         transfer_succeeded_event() {}
         transfer_succeeded_event(account_id_type from, account_id_type to, const collectible_id_type &id)
            : from(from), to(to), collectible(id) {}

         account_id_type from;
         account_id_type to;
         collectible_id_type collectible;
      };

      struct price_set_event {
         price_set_event() {}
         price_set_event(const collectible_id_type &id, share_type price)
            : collectible(id), price(price) {}

         collectible_id_type collectible;
         share_type price;
      };

      struct not_longer_on_sale_event {
         not_longer_on_sale_event() {}
         explicit not_longer_on_sale_event(const collectible_id_type &id)
            : collectible(id) {}

         collectible_id_type collectible;
      };

      struct sold_event {
         sold_event() {}
         sold_event(account_id_type seller, account_id_type buyer, const collectible_id_type &id, share_type price)
            : seller(seller), buyer(buyer), collectible(id), price(price) {}

         account_id_type seller;
         account_id_type buyer;
         collectible_id_type collectible;

         /// Amount settled from the buyer to the seller
         share_type price;
      };

      typedef fc::static_variant<
         collectible_created_event,
         collectible_destroyed_event,
         transfer_succeeded_event,
         price_set_event,
         not_longer_on_sale_event,
         sold_event
      > collectible_event;

   }
} // trove::protocol

FC_REFLECT( trove::protocol::collectible_created_event, (collectible)(owner) )
FC_REFLECT( trove::protocol::collectible_destroyed_event, (collectible) )
FC_REFLECT( trove::protocol::transfer_succeeded_event, (from)(to)(collectible) )
FC_REFLECT( trove::protocol::price_set_event, (collectible)(price) )
FC_REFLECT( trove::protocol::not_longer_on_sale_event, (collectible) )
FC_REFLECT( trove::protocol::sold_event, (seller)(buyer)(collectible)(price) )
FC_REFLECT_TYPENAME( trove::protocol::collectible_event )
