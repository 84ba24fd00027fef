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
#include <trove/chain/collectible_evaluator.hpp>
#include <trove/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace trove::chain;
using namespace trove::chain::test;

BOOST_FIXTURE_TEST_SUITE( collectible_transfer_tests, database_fixture )

/**
 * Move a collectible between two accounts
 */
BOOST_AUTO_TEST_CASE( collectible_transfer_a ) {
   try {
      ACTORS((alice)(bob));

      const collectible_id_type id = mint(alice_id);
      db.clear_applied_events();

      BOOST_TEST_MESSAGE("Alice is transferring her collectible to Bob");
      transfer(alice_id, bob_id, id);

      const collectible_object &c = db.get_collectible(id);
      BOOST_CHECK(c.owner == bob_id);
      BOOST_CHECK_EQUAL(held_by(alice_id), 0u);
      BOOST_REQUIRE_EQUAL(held_by(bob_id), 1u);
      BOOST_CHECK(db.get_collectibles_owned_by(bob_id)[0] == id);
      BOOST_CHECK_EQUAL(db.get_collectible_count(), 1u);

      BOOST_REQUIRE_EQUAL(db.get_applied_events().size(), 1u);
      const collectible_event &event = db.get_applied_events().back();
      BOOST_REQUIRE(event.is_type<transfer_succeeded_event>());
      const transfer_succeeded_event &e = event.get<transfer_succeeded_event>();
      BOOST_CHECK(e.from == alice_id);
      BOOST_CHECK(e.to == bob_id);
      BOOST_CHECK(e.collectible == id);

      BOOST_TEST_MESSAGE("Bob is sending it back");
      transfer(bob_id, alice_id, id);
      BOOST_CHECK(db.get_collectible(id).owner == alice_id);
      BOOST_CHECK_EQUAL(held_by(alice_id), 1u);
      BOOST_CHECK_EQUAL(held_by(bob_id), 0u);
   } FC_LOG_AND_RETHROW()
}

/**
 * A transfer takes the collectible off the market
 */
BOOST_AUTO_TEST_CASE( collectible_transfer_resets_listing ) {
   try {
      ACTORS((alice)(bob));

      const collectible_id_type id = mint(alice_id);
      set_price(alice_id, id, 250);
      BOOST_REQUIRE(db.get_collectible(id).is_for_sale());

      transfer(alice_id, bob_id, id);
      BOOST_CHECK(!db.get_collectible(id).is_for_sale());
      BOOST_CHECK(!db.get_collectible(id).price.valid());
   } FC_LOG_AND_RETHROW()
}

/**
 * Removal from the sender's holdings swaps the last ID into the vacated slot
 */
BOOST_AUTO_TEST_CASE( collectible_transfer_reorders_sender ) {
   try {
      ACTORS((alice)(bob));

      const collectible_id_type c0 = mint(alice_id);
      const collectible_id_type c1 = mint(alice_id);
      const collectible_id_type c2 = mint(alice_id);
      const collectible_id_type c3 = mint(alice_id);

      transfer(alice_id, bob_id, c1);

      const vector<collectible_id_type> held = db.get_collectibles_owned_by(alice_id);
      BOOST_REQUIRE_EQUAL(held.size(), 3u);
      BOOST_CHECK(held[0] == c0);
      BOOST_CHECK(held[1] == c3);
      BOOST_CHECK(held[2] == c2);

      BOOST_TEST_MESSAGE("Removing the last ID leaves the others in place");
      transfer(alice_id, bob_id, c2);
      const vector<collectible_id_type> after = db.get_collectibles_owned_by(alice_id);
      BOOST_REQUIRE_EQUAL(after.size(), 2u);
      BOOST_CHECK(after[0] == c0);
      BOOST_CHECK(after[1] == c3);

      const vector<collectible_id_type> bob_held = db.get_collectibles_owned_by(bob_id);
      BOOST_REQUIRE_EQUAL(bob_held.size(), 2u);
      BOOST_CHECK(bob_held[0] == c1);
      BOOST_CHECK(bob_held[1] == c2);
   } FC_LOG_AND_RETHROW()
}

/**
 * Rejected transfers
 */
BOOST_AUTO_TEST_CASE( collectible_transfer_invalid ) {
   try {
      ACTORS((alice)(bob)(charlie));

      const collectible_id_type id = mint(alice_id);
      db.clear_applied_events();

      BOOST_TEST_MESSAGE("Alice is attempting to transfer her collectible to herself");
      TROVE_REQUIRE_THROW(transfer(alice_id, alice_id, id), transfer_to_self);
      REQUIRE_EXCEPTION_WITH_TEXT(transfer(alice_id, alice_id, id), "to itself");

      BOOST_TEST_MESSAGE("Bob is attempting to transfer Alice's collectible");
      TROVE_REQUIRE_THROW(transfer(bob_id, charlie_id, id), not_owner);

      BOOST_TEST_MESSAGE("Transferring an unknown collectible");
      const collectible_id_type unknown("ffffffffffffffffffffffffffffffff");
      TROVE_REQUIRE_THROW(transfer(alice_id, bob_id, unknown), no_collectible);

      BOOST_CHECK(db.get_collectible(id).owner == alice_id);
      BOOST_CHECK_EQUAL(held_by(alice_id), 1u);
      BOOST_CHECK_EQUAL(held_by(bob_id), 0u);
      BOOST_CHECK_EQUAL(held_by(charlie_id), 0u);
      BOOST_CHECK(db.get_applied_events().empty());
   } FC_LOG_AND_RETHROW()
}

/**
 * Staging a transfer leaves the database untouched until it is applied
 */
BOOST_AUTO_TEST_CASE( pending_collectible_transfer_staging ) {
   try {
      ACTORS((alice)(bob));

      const collectible_id_type id = mint(alice_id);
      set_price(alice_id, id, 10);

      const pending_collectible_transfer ptx = evaluate_collectible_transfer(db, db.get_collectible(id), bob_id);
      BOOST_CHECK(ptx.from == alice_id);
      BOOST_CHECK(ptx.to == bob_id);
      BOOST_CHECK(ptx.from_collectibles.empty());
      BOOST_REQUIRE_EQUAL(ptx.to_collectibles.size(), 1u);
      BOOST_CHECK(ptx.ptr_to_holdings == nullptr);

      BOOST_TEST_MESSAGE("Nothing changed yet");
      BOOST_CHECK(db.get_collectible(id).owner == alice_id);
      BOOST_CHECK(db.get_collectible(id).is_for_sale());
      BOOST_CHECK_EQUAL(held_by(alice_id), 1u);
      BOOST_CHECK(db.find_holdings(bob_id) == nullptr);

      apply_collectible_transfer(db, ptx);
      BOOST_CHECK(db.get_collectible(id).owner == bob_id);
      BOOST_CHECK(!db.get_collectible(id).is_for_sale());
      BOOST_CHECK_EQUAL(held_by(alice_id), 0u);
      BOOST_CHECK_EQUAL(held_by(bob_id), 1u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()

struct single_holding_fixture : database_fixture {
   single_holding_fixture()
      : database_fixture(parameters_with_maximum_owned(1)) {
   }
};

BOOST_FIXTURE_TEST_SUITE( collectible_transfer_bound_tests, single_holding_fixture )

/**
 * A recipient at the holdings bound cannot receive
 */
BOOST_AUTO_TEST_CASE( collectible_transfer_maximum_owned ) {
   try {
      ACTORS((alice)(bob));

      const collectible_id_type a = mint(alice_id);
      const collectible_id_type b = mint(bob_id);
      db.clear_applied_events();

      BOOST_TEST_MESSAGE("Alice is attempting to transfer to Bob, who is full");
      TROVE_REQUIRE_THROW(transfer(alice_id, bob_id, a), maximum_collectibles_owned);

      BOOST_CHECK(db.get_collectible(a).owner == alice_id);
      BOOST_CHECK(db.get_collectible(b).owner == bob_id);
      BOOST_CHECK_EQUAL(held_by(alice_id), 1u);
      BOOST_CHECK_EQUAL(held_by(bob_id), 1u);
      BOOST_CHECK(db.get_applied_events().empty());

      BOOST_TEST_MESSAGE("Once Bob destroys his collectible the transfer succeeds");
      destroy(bob_id, b);
      transfer(alice_id, bob_id, a);
      BOOST_CHECK(db.get_collectible(a).owner == bob_id);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
