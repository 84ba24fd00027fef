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
#include <trove/chain/database.hpp>

namespace trove {
   namespace chain {

      const chain_parameters &database::get_chain_parameters() const {
         return _parameters;
      }

      const collectible_object *database::find_collectible(const collectible_id_type &id) const {
         const auto &idx = get_index_type<collectible_index>().indices().get<by_collectible_id>();
         auto itr = idx.find(id);
         if (itr == idx.end())
            return nullptr;
         return &(*itr);
      }

      const collectible_object &database::get_collectible(const collectible_id_type &id) const {
         const collectible_object *ptr = find_collectible(id);
         TROVE_ASSERT(ptr != nullptr, no_collectible, "Collectible ${id} does not exist", ("id", id));
         return *ptr;
      }

      const collectible_holdings_object *database::find_holdings(account_id_type account) const {
         const auto &idx = get_index_type<collectible_holdings_index>().indices().get<by_owner>();
         auto itr = idx.find(account);
         if (itr == idx.end())
            return nullptr;
         return &(*itr);
      }

      vector<collectible_id_type> database::get_collectibles_owned_by(account_id_type account) const {
         const collectible_holdings_object *holdings = find_holdings(account);
         if (holdings == nullptr)
            return {};
         return holdings->collectibles;
      }

      uint64_t database::get_collectible_count() const {
         return _registry_properties.collectible_count;
      }

      const registry_properties_object &database::get_registry_properties() const {
         return _registry_properties;
      }

      const vector<collectible_event> &database::get_applied_events() const {
         return _applied_events;
      }

      void database::clear_applied_events() {
         _applied_events.clear();
      }

   }
} // trove::chain
