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
#include <trove/chain/collectible_evaluator.hpp>

#include <fc/log/logger.hpp>

namespace trove {
   namespace chain {

      database::database(const chain_parameters &params,
                         settlement_interface &settlement,
                         const entropy_source &entropy,
                         const sequence_provider &sequence)
         : _parameters(params), _settlement(settlement), _entropy(entropy), _sequence(sequence) {
         try {
            _parameters.validate();
            initialize_evaluators();
            ilog("Collectible registry initialized with parameters ${p}", ("p", _parameters));
         } FC_CAPTURE_AND_RETHROW((params))
      }

      database::~database() {}

      void database::initialize_evaluators() {
         _operation_evaluators.resize(operation::count());
         register_evaluator<collectible_create_evaluator>();
         register_evaluator<collectible_destroy_evaluator>();
         register_evaluator<collectible_transfer_evaluator>();
         register_evaluator<collectible_set_price_evaluator>();
         register_evaluator<collectible_remove_from_market_evaluator>();
         register_evaluator<collectible_buy_evaluator>();
      }

      operation_result database::apply_operation(const operation &op) {
         try {
            operation_validate(op);

            const int i_which = op.which();
            const uint64_t u_which = static_cast<uint64_t>(i_which);
            FC_ASSERT(i_which >= 0, "Negative operation tag in operation ${op}", ("op", op));
            FC_ASSERT(u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}",
                      ("op", op));
            std::unique_ptr<op_evaluator> &eval = _operation_evaluators[u_which];
            FC_ASSERT(eval, "No registered evaluator for operation ${op}", ("op", op));

            operation_evaluation_state eval_state(this);
            return eval->evaluate(eval_state, op);
         } catch (const fc::exception &e) {
            dlog("Rejected operation from ${caller}: ${e}",
                 ("caller", operation_caller(op))("e", e.to_string()));
            throw;
         }
      }

      void database::push_applied_event(const collectible_event &event) {
         _applied_events.push_back(event);
         try {
            applied_event(event);
         } FC_CAPTURE_AND_LOG((event))
      }

   }
} // trove::chain
