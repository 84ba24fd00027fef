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
#include <trove/chain/evaluator.hpp>
#include <trove/chain/database.hpp>

#include <fc/exception/exception.hpp>

namespace trove {
   namespace chain {

      database &operation_evaluation_state::db() const {
         FC_ASSERT(_db, "No database attached to the evaluation state");
         return *_db;
      }

      database &generic_evaluator::db() const {
         return trx_state->db();
      }

      operation_result generic_evaluator::start_evaluate(operation_evaluation_state &eval_state, const operation &op) {
         try {
            trx_state = &eval_state;
            evaluate(op);
            return apply(op);
         } FC_CAPTURE_AND_RETHROW()
      }

   }
} // trove::chain
