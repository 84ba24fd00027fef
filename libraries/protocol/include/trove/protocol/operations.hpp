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

#include <trove/protocol/collectible.hpp>
#include <trove/protocol/collectible_events.hpp>

namespace trove {
   namespace protocol {

      /**
       * @brief The fixed set of state transitions a registry accepts
       *
       * The position of an operation within the variant is its tag; new operations may only be appended.
       */
      typedef fc::static_variant<
         collectible_create_operation,
         collectible_destroy_operation,
         collectible_transfer_operation,
         collectible_set_price_operation,
         collectible_remove_from_market_operation,
         collectible_buy_operation
      > operation;

      /// Minting returns the identifier of the new collectible; everything else returns nothing
      typedef fc::static_variant<void_result, collectible_id_type> operation_result;

      /// Stateless checks of an operation's own fields
      void operation_validate(const operation &op);

      /// Account on whose behalf the operation runs
      account_id_type operation_caller(const operation &op);

   }
} // trove::protocol

FC_REFLECT_TYPENAME( trove::protocol::operation )
FC_REFLECT_TYPENAME( trove::protocol::operation_result )
