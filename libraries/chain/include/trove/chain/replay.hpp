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

#include <trove/chain/database.hpp>
#include <trove/chain/simple_host.hpp>

#include <vector>

namespace trove {
   namespace chain {

      /// Operations grouped by block, in application order
      typedef std::vector<std::vector<operation>> replay_block_list;

      struct replay_summary {
         uint64_t blocks = 0;
         uint64_t applied = 0;
         uint64_t rejected = 0;
      };

      /**
       * Apply blocks of operations in order
       *
       * A rejected operation is logged and skipped.  The sequence moves to the next operation after
       * every attempt and to the next block after every block.  Events stay on the database's list only
       * until their block closes; subscribe to database::applied_event to observe all of them.
       *
       * @param db Database to apply to
       * @param sequence Sequence provider the database was built with
       * @param blocks Operations to apply
       * @return Counts of blocks, applied and rejected operations
       */
      replay_summary replay_blocks(database &db, block_sequence &sequence, const replay_block_list &blocks);

   }
} // trove::chain

FC_REFLECT( trove::chain::replay_summary, (blocks)(applied)(rejected) )
