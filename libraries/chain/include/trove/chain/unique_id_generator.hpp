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

#include <fc/crypto/sha256.hpp>

namespace trove {
   namespace chain {
      using namespace trove::protocol;

      /**
       * @brief Everything a new collectible identifier is derived from
       *
       * The random value is drawn from the host's entropy source under the
       * TROVE_UNIQUE_ID_DOMAIN tag; the two counters come from the sequence provider.
       */
      struct unique_id_payload {
         fc::sha256 random;
         uint32_t op_index = 0;
         uint32_t block_num = 0;
      };

      struct generated_unique_id {
         collectible_id_type id;
         collectible_attribute attribute = collectible_attribute::red;
      };

      /**
       * Derive a collectible identifier and its attribute
       *
       * The payload is raw-packed and hashed.  The identifier is the leading bytes of the digest
       * and the attribute follows the parity of its first byte: red when even, yellow when odd.
       * Uniqueness is not checked here.
       *
       * @param payload Random value and sequencing context
       * @return Identifier and attribute
       */
      generated_unique_id generate_unique_id(const unique_id_payload &payload);

   }
} // trove::chain

FC_REFLECT( trove::chain::unique_id_payload, (random)(op_index)(block_num) )
