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

#include <fc/crypto/sha256.hpp>
#include <fc/io/raw_fwd.hpp>
#include <fc/reflect/typename.hpp>

#include <array>
#include <cstdint>
#include <string>

#include <trove/protocol/config.hpp>

namespace trove {
   namespace protocol {

      /**
       * @brief 16-byte opaque identifier of a collectible
       *
       * Modeled after the fc hash types: a fixed block of bytes that is totally ordered,
       * prints as hex and packs as its raw bytes.
       */
      class collectible_id_type {
      public:
         typedef std::array<uint8_t, TROVE_COLLECTIBLE_ID_SIZE> bytes_type;

         collectible_id_type();
         explicit collectible_id_type(const std::string &hex_str);
         explicit collectible_id_type(const bytes_type &bytes);

         /// Truncate a digest to its leading TROVE_COLLECTIBLE_ID_SIZE bytes
         static collectible_id_type from_digest(const fc::sha256 &digest);

         std::string str() const;

         const uint8_t *data() const { return _bytes.data(); }
         uint8_t *data() { return _bytes.data(); }
         static constexpr size_t data_size() { return TROVE_COLLECTIBLE_ID_SIZE; }

         friend bool operator==(const collectible_id_type &a, const collectible_id_type &b) {
            return a._bytes == b._bytes;
         }

         friend bool operator!=(const collectible_id_type &a, const collectible_id_type &b) {
            return a._bytes != b._bytes;
         }

         friend bool operator<(const collectible_id_type &a, const collectible_id_type &b) {
            return a._bytes < b._bytes;
         }

      private:
         bytes_type _bytes;
      };

   }
} // trove::protocol

namespace fc {
   class variant;

   void to_variant(const trove::protocol::collectible_id_type &id, variant &v, uint32_t max_depth = 1);
   void from_variant(const variant &v, trove::protocol::collectible_id_type &id, uint32_t max_depth = 1);

   namespace raw {
      template<typename Stream>
      inline void pack(Stream &s, const trove::protocol::collectible_id_type &id,
                       uint32_t _max_depth = FC_PACK_MAX_DEPTH) {
         s.write(reinterpret_cast<const char *>(id.data()), id.data_size());
      }

      template<typename Stream>
      inline void unpack(Stream &s, trove::protocol::collectible_id_type &id,
                         uint32_t _max_depth = FC_PACK_MAX_DEPTH) {
         s.read(reinterpret_cast<char *>(id.data()), id.data_size());
      }
   }
}

FC_REFLECT_TYPENAME( trove::protocol::collectible_id_type )
