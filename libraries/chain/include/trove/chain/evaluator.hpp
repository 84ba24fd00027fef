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

#include <trove/protocol/operations.hpp>

namespace trove {
   namespace chain {
      using namespace trove::protocol;

      class database;

      /// State shared by the evaluators of a single operation
      class operation_evaluation_state {
      public:
         explicit operation_evaluation_state(database *db = nullptr) : _db(db) {}

         database &db() const;

         database *_db;
      };

      class generic_evaluator {
      public:
         virtual ~generic_evaluator() {}

         /**
          * Check the operation against the current state, then commit it
          *
          * Evaluation throws before anything is written.  Once it succeeds the only step of apply
          * allowed to fail is a settlement performed ahead of every registry write.
          */
         virtual operation_result start_evaluate(operation_evaluation_state &eval_state, const operation &op);

         virtual operation_result evaluate(const operation &op) = 0;

         virtual operation_result apply(const operation &op) = 0;

         database &db() const;

         operation_evaluation_state *trx_state = nullptr;
      };

      class op_evaluator {
      public:
         virtual ~op_evaluator() {}

         virtual operation_result evaluate(operation_evaluation_state &eval_state, const operation &op) = 0;
      };

      template<typename T>
      class op_evaluator_impl : public op_evaluator {
      public:
         virtual operation_result evaluate(operation_evaluation_state &eval_state, const operation &op) override {
            T eval;
            return eval.start_evaluate(eval_state, op);
         }
      };

      template<typename DerivedEvaluator>
      class evaluator : public generic_evaluator {
      public:
         virtual operation_result evaluate(const operation &o) final override {
            auto *eval = static_cast<DerivedEvaluator *>(this);
            const auto &op = o.get<typename DerivedEvaluator::operation_type>();

            return eval->do_evaluate(op);
         }

         virtual operation_result apply(const operation &o) final override {
            auto *eval = static_cast<DerivedEvaluator *>(this);
            const auto &op = o.get<typename DerivedEvaluator::operation_type>();

            return eval->do_apply(op);
         }
      };

   }
} // trove::chain
