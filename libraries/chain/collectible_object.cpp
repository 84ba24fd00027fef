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
#include <trove/chain/collectible_object.hpp>

#include <algorithm>

using namespace trove::chain;

bool collectible_holdings_object::try_append(const collectible_id_type &id, uint32_t maximum_owned) {
   if (collectibles.size() >= maximum_owned) {
      return false;
   }
   collectibles.push_back(id);
   return true;
}

// O(1) after the scan, at the cost of the relative order of the remaining IDs
bool collectible_holdings_object::swap_remove(const collectible_id_type &id) {
   auto itr = std::find(collectibles.begin(), collectibles.end(), id);
   if (itr == collectibles.end()) {
      return false;
   }
   *itr = collectibles.back();
   collectibles.pop_back();
   return true;
}

bool collectible_holdings_object::holds(const collectible_id_type &id) const {
   return std::find(collectibles.begin(), collectibles.end(), id) != collectibles.end();
}
