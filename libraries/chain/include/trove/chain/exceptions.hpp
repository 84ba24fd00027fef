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

#define TROVE_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                        \
      if( !(expr) )                                                \
         FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );      \
   FC_MULTILINE_MACRO_END

namespace trove {
   namespace chain {

      FC_DECLARE_EXCEPTION( collectible_exception, 4000000 )

      /// Each collectible must have a unique identifier
      FC_DECLARE_DERIVED_EXCEPTION( duplicate_collectible,      collectible_exception, 4000001 )
      /// An account can't exceed the maximum_owned parameter
      FC_DECLARE_DERIVED_EXCEPTION( maximum_collectibles_owned, collectible_exception, 4000002 )
      /// The total supply of collectibles can't exceed the uint64_t limit
      FC_DECLARE_DERIVED_EXCEPTION( bounds_overflow,            collectible_exception, 4000003 )
      FC_DECLARE_DERIVED_EXCEPTION( no_collectible,             collectible_exception, 4000004 )
      FC_DECLARE_DERIVED_EXCEPTION( not_owner,                  collectible_exception, 4000005 )
      FC_DECLARE_DERIVED_EXCEPTION( transfer_to_self,           collectible_exception, 4000006 )
      /// Buying or delisting a collectible which is not on sale
      FC_DECLARE_DERIVED_EXCEPTION( collectible_not_for_sale,   collectible_exception, 4000007 )
      /// Buying a collectible under its price
      FC_DECLARE_DERIVED_EXCEPTION( offered_price_too_low,      collectible_exception, 4000008 )

      /// Raised by the reference settlement ledger
      FC_DECLARE_EXCEPTION( settlement_exception, 4100000 )
      FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,       settlement_exception,  4100001 )

   }
} // trove::chain
