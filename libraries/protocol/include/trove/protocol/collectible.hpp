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

namespace trove {
   namespace protocol {
      struct collectible_create_operation {
         /// This account must be authenticated by the host.
         /// It becomes the owner of the new collectible.
         account_id_type owner;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const {}

         account_id_type fee_payer() const { return owner; }
      };

      struct collectible_destroy_operation {
         /// This account must be authenticated by the host.
         /// This account must also be the current owner of the collectible.
         account_id_type owner;

         /// Collectible to destroy
         collectible_id_type collectible;

         void validate() const {}

         account_id_type fee_payer() const { return owner; }
      };

      /**
       * @brief Transfer a collectible to another account
       *
       * Any account that holds a collectible can send it to another account.
       * A transfer takes the collectible off the market.
       */
      struct collectible_transfer_operation {
         /// This account must be authenticated by the host.
         /// This account must also be the current owner of the collectible.
         account_id_type from;

         /// Account to transfer the collectible to
         account_id_type to;

         /// Collectible to transfer
         collectible_id_type collectible;

         void validate() const {}

         account_id_type fee_payer() const { return from; }
      };

      struct collectible_set_price_operation {
         /// This account must be authenticated by the host.
         /// This account must also be the current owner of the collectible.
         account_id_type owner;

         /// Collectible to list
         collectible_id_type collectible;

         /// Asking price
         share_type price;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         account_id_type fee_payer() const { return owner; }
      };

      struct collectible_remove_from_market_operation {
         /// This account must be authenticated by the host.
         /// This account must also be the current owner of the collectible.
         account_id_type owner;

         /// Collectible to delist
         collectible_id_type collectible;

         void validate() const {}

         account_id_type fee_payer() const { return owner; }
      };

      /**
       * @brief Purchase a listed collectible
       *
       * The buyer is charged the listed price, even when the offer exceeds it.
       */
      struct collectible_buy_operation {
         /// This account must be authenticated by the host.
         /// This account pays the seller.
         account_id_type buyer;

         /// Collectible to purchase
         collectible_id_type collectible;

         /// Highest price the buyer accepts to pay
         share_type offered_price;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         account_id_type fee_payer() const { return buyer; }
      };

   }
} // trove::protocol

FC_REFLECT( trove::protocol::collectible_create_operation, (owner) )
FC_REFLECT( trove::protocol::collectible_destroy_operation, (owner)(collectible) )
FC_REFLECT( trove::protocol::collectible_transfer_operation, (from)(to)(collectible) )
FC_REFLECT( trove::protocol::collectible_set_price_operation, (owner)(collectible)(price) )
FC_REFLECT( trove::protocol::collectible_remove_from_market_operation, (owner)(collectible) )
FC_REFLECT( trove::protocol::collectible_buy_operation, (buyer)(collectible)(offered_price) )
