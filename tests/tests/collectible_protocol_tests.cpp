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
#include <boost/test/unit_test.hpp>

#include <trove/chain/database.hpp>
#include <trove/chain/simple_host.hpp>
#include <trove/protocol/chain_parameters.hpp>
#include <trove/protocol/operations.hpp>

#include <fc/io/json.hpp>
#include <fc/variant.hpp>

#include "../common/database_fixture.hpp"

using namespace trove::chain;
using namespace trove::chain::test;

BOOST_AUTO_TEST_SUITE( collectible_protocol_tests )

BOOST_AUTO_TEST_CASE( operation_validation ) {
   try {
      collectible_set_price_operation set_price;
      set_price.price = 0;
      operation_validate(set_price);
      set_price.price = -1;
      REQUIRE_EXCEPTION_WITH_TEXT(operation_validate(set_price), "should not be negative");

      collectible_buy_operation buy;
      buy.offered_price = 10;
      operation_validate(buy);
      buy.offered_price = -10;
      TROVE_REQUIRE_THROW(operation_validate(buy), fc::assert_exception);

      collectible_transfer_operation transfer;
      transfer.from = account_id_type(1);
      transfer.to = account_id_type(2);
      operation_validate(transfer);
      BOOST_CHECK(operation_caller(transfer) == account_id_type(1));
      BOOST_CHECK(operation_caller(buy) == buy.buyer);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( operation_from_json ) {
   try {
      const std::string json =
         "[2,{\"from\":{\"instance\":1},\"to\":{\"instance\":2},"
         "\"collectible\":\"00112233445566778899aabbccddeeff\"}]";
      const operation op = fc::json::from_string(json).as<operation>(TROVE_MAX_NESTED_OBJECTS);

      BOOST_REQUIRE(op.is_type<collectible_transfer_operation>());
      const collectible_transfer_operation &transfer = op.get<collectible_transfer_operation>();
      BOOST_CHECK(transfer.from == account_id_type(1));
      BOOST_CHECK(transfer.to == account_id_type(2));
      BOOST_CHECK_EQUAL(transfer.collectible.str(), "00112233445566778899aabbccddeeff");
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( chain_parameters_validation ) {
   try {
      chain_parameters params;
      BOOST_CHECK_EQUAL(params.maximum_owned, TROVE_DEFAULT_MAXIMUM_OWNED);
      params.validate();

      params.maximum_owned = 0;
      TROVE_REQUIRE_THROW(params.validate(), fc::assert_exception);

      BOOST_TEST_MESSAGE("A registry refuses invalid parameters");
      in_memory_balance_ledger ledger;
      seeded_entropy_source entropy("params");
      block_sequence sequence;
      TROVE_REQUIRE_THROW((database(params, ledger, entropy, sequence)), fc::assert_exception);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
