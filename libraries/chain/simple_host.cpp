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
#include <trove/chain/simple_host.hpp>
#include <trove/chain/exceptions.hpp>

#include <fc/log/logger.hpp>

#include <limits>

namespace trove {
   namespace chain {

      void in_memory_balance_ledger::transfer(account_id_type from, account_id_type to, const share_type &amount) {
         try {
            FC_ASSERT(amount >= 0, "Cannot transfer a negative amount");
            const share_type from_balance = get_balance(from);
            TROVE_ASSERT(from_balance >= amount, insufficient_balance,
                         "Insufficient balance: ${balance}, unable to transfer ${amount}",
                         ("balance", from_balance)("amount", amount));

            if (from == to)
               return;

            // Compute both balances before touching either one
            const share_type to_balance = get_balance(to) + amount;
            _balances[from] = from_balance - amount;
            _balances[to] = to_balance;
         } FC_CAPTURE_AND_RETHROW((from)(to)(amount))
      }

      void in_memory_balance_ledger::adjust_balance(account_id_type account, const share_type &delta) {
         const share_type new_balance = get_balance(account) + delta;
         if (new_balance < 0) {
            wlog("Refusing to leave account ${a} with a negative balance of ${b}",
                 ("a", account)("b", new_balance));
            FC_THROW_EXCEPTION(insufficient_balance, "Adjustment would make the balance of ${a} negative",
                               ("a", account)("delta", delta));
         }
         _balances[account] = new_balance;
      }

      share_type in_memory_balance_ledger::get_balance(account_id_type account) const {
         auto itr = _balances.find(account);
         if (itr == _balances.end())
            return share_type(0);
         return itr->second;
      }

      fc::sha256 seeded_entropy_source::random(const std::string &domain_tag) const {
         return fc::sha256::hash(_seed + domain_tag);
      }

      void block_sequence::next_operation() {
         FC_ASSERT(_op_index < std::numeric_limits<uint32_t>::max(), "Operation index overflow in block ${b}",
                   ("b", _block_num));
         ++_op_index;
      }

      void block_sequence::generate_block() {
         FC_ASSERT(_block_num < std::numeric_limits<uint32_t>::max(), "Block number overflow");
         ++_block_num;
         _op_index = 0;
      }

   }
} // trove::chain
