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
#include <trove/chain/replay.hpp>

#include <fc/log/logger.hpp>

namespace trove {
   namespace chain {

      replay_summary replay_blocks(database &db, block_sequence &sequence, const replay_block_list &blocks) {
         replay_summary summary;
         for (const auto &block : blocks) {
            for (const auto &op : block) {
               try {
                  db.apply_operation(op);
                  ++summary.applied;
               } catch (const fc::exception &e) {
                  wlog("Operation rejected at block ${b} index ${i}: ${e}",
                       ("b", sequence.head_block_num())("i", sequence.current_op_index())("e", e.to_string()));
                  ++summary.rejected;
               }
               sequence.next_operation();
            }

            db.clear_applied_events();
            sequence.generate_block();
            ++summary.blocks;
         }
         return summary;
      }

   }
} // trove::chain
