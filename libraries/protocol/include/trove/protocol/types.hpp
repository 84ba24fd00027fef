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

#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/static_variant.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <trove/protocol/config.hpp>
#include <trove/protocol/collectible_id.hpp>

namespace trove {
   namespace protocol {
      using std::string;
      using std::vector;
      using fc::optional;

      /// Amount type used for marketplace prices.
      /// Arithmetic on it is checked; an overflow throws rather than wrapping.
      typedef fc::safe<int64_t> share_type;

      /**
       * @brief Opaque handle of an authenticated account
       *
       * Accounts are produced by the host's authentication layer; the registry only compares them.
       */
      struct account_id_type {
         account_id_type() = default;

         explicit account_id_type(uint64_t i) : instance(i) {}

         uint64_t instance = 0;

         friend bool operator==(const account_id_type &a, const account_id_type &b) {
            return a.instance == b.instance;
         }

         friend bool operator!=(const account_id_type &a, const account_id_type &b) {
            return a.instance != b.instance;
         }

         friend bool operator<(const account_id_type &a, const account_id_type &b) {
            return a.instance < b.instance;
         }
      };

      /// Attribute tag carried by every collectible
      enum class collectible_attribute : uint8_t {
         red,
         yellow,
         blue,
         green
      };

      struct void_result {
      };

   }
} // trove::protocol

FC_REFLECT( trove::protocol::account_id_type, (instance) )
FC_REFLECT_ENUM( trove::protocol::collectible_attribute, (red)(yellow)(blue)(green) )
FC_REFLECT( trove::protocol::void_result, )
