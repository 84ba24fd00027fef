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

#include <trove/chain/host_interfaces.hpp>

#include <map>
#include <string>
#include <utility>

namespace trove {
   namespace chain {

      /**
       * @brief Account balances kept in memory
       *
       * A reference settlement layer for tests and the replay tool.
       */
      class in_memory_balance_ledger : public settlement_interface {
      public:
         void transfer(account_id_type from, account_id_type to, const share_type &amount) override;

         /// Credit (or debit, with a negative delta) an account
         void adjust_balance(account_id_type account, const share_type &delta);

         share_type get_balance(account_id_type account) const;

      private:
         std::map<account_id_type, share_type> _balances;
      };

      /// Deterministic entropy: the hash of a fixed seed and the domain tag
      class seeded_entropy_source : public entropy_source {
      public:
         explicit seeded_entropy_source(std::string seed) : _seed(std::move(seed)) {}

         fc::sha256 random(const std::string &domain_tag) const override;

      private:
         std::string _seed;
      };

      /**
       * @brief Operation counter that restarts with every block
       *
       * The first block is number 1.
       */
      class block_sequence : public sequence_provider {
      public:
         block_sequence() = default;

         /// Resume at a given position, as a host restarting mid-chain does
         block_sequence(uint32_t block_num, uint32_t op_index) : _op_index(op_index), _block_num(block_num) {}

         uint32_t current_op_index() const override { return _op_index; }

         uint32_t head_block_num() const override { return _block_num; }

         /// Move to the next operation of the current block
         void next_operation();

         /// Close the current block and open the next one
         void generate_block();

      private:
         uint32_t _op_index = 0;
         uint32_t _block_num = 1;
      };

   }
} // trove::chain
