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
#include <trove/protocol/collectible_id.hpp>

#include <fc/crypto/hex.hpp>
#include <fc/exception/exception.hpp>
#include <fc/variant.hpp>

#include <cstring>

namespace trove {
   namespace protocol {

      collectible_id_type::collectible_id_type() {
         _bytes.fill(0);
      }

      collectible_id_type::collectible_id_type(const std::string &hex_str) {
         _bytes.fill(0);
         FC_ASSERT(hex_str.size() == 2 * TROVE_COLLECTIBLE_ID_SIZE,
                   "A collectible ID should be ${expected} hex characters rather than ${actual}",
                   ("expected", 2 * TROVE_COLLECTIBLE_ID_SIZE)("actual", hex_str.size()));
         const size_t decoded = fc::from_hex(hex_str, reinterpret_cast<char *>(_bytes.data()), _bytes.size());
         FC_ASSERT(decoded == _bytes.size(), "Invalid collectible ID: ${id}", ("id", hex_str));
      }

      collectible_id_type::collectible_id_type(const bytes_type &bytes)
         : _bytes(bytes) {
      }

      collectible_id_type collectible_id_type::from_digest(const fc::sha256 &digest) {
         static_assert(TROVE_COLLECTIBLE_ID_SIZE <= 256 / 8, "A collectible ID is taken from a single SHA-256 digest");
         collectible_id_type id;
         std::memcpy(id._bytes.data(), digest.data(), id._bytes.size());
         return id;
      }

      std::string collectible_id_type::str() const {
         return fc::to_hex(reinterpret_cast<const char *>(_bytes.data()), static_cast<uint32_t>(_bytes.size()));
      }

   }
} // trove::protocol

namespace fc {
   void to_variant(const trove::protocol::collectible_id_type &id, variant &v, uint32_t max_depth) {
      v = variant(id.str());
   }

   void from_variant(const variant &v, trove::protocol::collectible_id_type &id, uint32_t max_depth) {
      id = trove::protocol::collectible_id_type(v.as_string());
   }
}
