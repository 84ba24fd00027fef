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

#include <string>

namespace trove {
   namespace chain {
      using namespace trove::protocol;

      /**
       * @brief Monetary transfer primitive of the surrounding ledger
       *
       * Implementations signal failure by throwing an fc::exception and must leave their own
       * state unchanged when they do.
       */
      class settlement_interface {
      public:
         virtual ~settlement_interface() = default;

         virtual void transfer(account_id_type from, account_id_type to, const share_type &amount) = 0;
      };

      /// Randomness beacon of the surrounding ledger
      class entropy_source {
      public:
         virtual ~entropy_source() = default;

         /**
          * Draw a random value
          * @param domain_tag Separates the draws of different subsystems
          */
         virtual fc::sha256 random(const std::string &domain_tag) const = 0;
      };

      /// Position of the operation being applied
      class sequence_provider {
      public:
         virtual ~sequence_provider() = default;

         /// Index of the current operation within its block
         virtual uint32_t current_op_index() const = 0;

         virtual uint32_t head_block_num() const = 0;
      };

   }
} // trove::chain
