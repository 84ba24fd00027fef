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

#include <fc/exception/exception.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

#include <utility>

namespace trove {
   namespace chain {
      using boost::multi_index_container;
      using namespace boost::multi_index;

      /**
       * @brief Maps an object type to the index that stores it
       *
       * Specialized with TROVE_MAP_OBJECT_TO_INDEX next to each object definition.
       */
      template<typename ObjectType>
      struct object_index_of;

      /**
       * @brief An in-memory table of objects with boost::multi_index lookups
       *
       * Objects are only ever created, modified and removed through the owning database;
       * everyone else reads them through indices().
       */
      template<typename ObjectType, typename MultiIndexType>
      class generic_index {
      public:
         typedef MultiIndexType index_type;
         typedef ObjectType object_type;

         template<typename Constructor>
         const object_type &create(Constructor &&c) {
            object_type item;
            c(item);
            auto insert_result = _indices.insert(std::move(item));
            FC_ASSERT(insert_result.second, "Could not create object! Most likely a uniqueness constraint was violated.");
            return *insert_result.first;
         }

         template<typename Modifier>
         void modify(const object_type &obj, Modifier &&m) {
            auto itr = _indices.iterator_to(obj);
            const bool ok = _indices.modify(itr, std::forward<Modifier>(m));
            FC_ASSERT(ok, "Could not modify object, most likely a uniqueness constraint was violated");
         }

         void remove(const object_type &obj) {
            _indices.erase(_indices.iterator_to(obj));
         }

         const index_type &indices() const { return _indices; }

         size_t size() const { return _indices.size(); }

      private:
         index_type _indices;
      };

   }
} // trove::chain

#define TROVE_MAP_OBJECT_TO_INDEX(OBJECT, INDEX)                     \
   namespace trove { namespace chain {                                \
      template<> struct object_index_of<OBJECT> { typedef INDEX type; }; \
   } }
