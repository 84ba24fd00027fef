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
#include <trove/chain/replay.hpp>

#include <fc/io/json.hpp>
#include <fc/variant.hpp>

#include "../common/database_fixture.hpp"

using namespace trove::chain;
using namespace trove::chain::test;

BOOST_FIXTURE_TEST_SUITE( replay_tests, database_fixture )

/**
 * Replay two blocks, one of them with a rejected operation
 */
BOOST_AUTO_TEST_CASE( replay_blocks_a ) {
   try {
      ACTORS((alice)(bob));

      const std::string json =
         "[[[0,{\"owner\":{\"instance\":1}}],"
         "[0,{\"owner\":{\"instance\":2}}],"
         "[1,{\"owner\":{\"instance\":1},\"collectible\":\"000102030405060708090a0b0c0d0e0f\"}]],"
         "[[0,{\"owner\":{\"instance\":1}}]]]";
      const replay_block_list blocks =
         fc::json::from_string(json).as<replay_block_list>(TROVE_MAX_NESTED_OBJECTS);
      BOOST_REQUIRE_EQUAL(blocks.size(), 2u);

      vector<collectible_event> observed;
      vector<size_t> listed_when_observed;
      db.applied_event.connect([&](const collectible_event &e) {
         observed.push_back(e);
         listed_when_observed.push_back(db.get_applied_events().size());
      });

      BOOST_TEST_MESSAGE("Replaying; the destroy of an unknown collectible is rejected and skipped");
      const replay_summary summary = replay_blocks(db, sequence, blocks);

      BOOST_CHECK_EQUAL(summary.blocks, 2u);
      BOOST_CHECK_EQUAL(summary.applied, 3u);
      BOOST_CHECK_EQUAL(summary.rejected, 1u);

      BOOST_CHECK_EQUAL(db.get_collectible_count(), 3u);
      BOOST_CHECK_EQUAL(held_by(alice_id), 2u);
      BOOST_CHECK_EQUAL(held_by(bob_id), 1u);

      BOOST_TEST_MESSAGE("Every event reached the subscriber");
      BOOST_REQUIRE_EQUAL(observed.size(), 3u);
      for (const collectible_event &e : observed)
         BOOST_CHECK(e.is_type<collectible_created_event>());

      BOOST_TEST_MESSAGE("The event list only holds the events of the open block");
      BOOST_REQUIRE_EQUAL(listed_when_observed.size(), 3u);
      BOOST_CHECK_EQUAL(listed_when_observed[0], 1u);
      BOOST_CHECK_EQUAL(listed_when_observed[1], 2u);
      BOOST_CHECK_EQUAL(listed_when_observed[2], 1u);
      BOOST_CHECK(db.get_applied_events().empty());

      BOOST_TEST_MESSAGE("The sequence sits at the start of the next block");
      BOOST_CHECK_EQUAL(sequence.head_block_num(), 3u);
      BOOST_CHECK_EQUAL(sequence.current_op_index(), 0u);
   } FC_LOG_AND_RETHROW()
}

/**
 * Each event prints as a single JSON line
 */
BOOST_AUTO_TEST_CASE( replay_event_json ) {
   try {
      ACTORS((alice)(bob));

      vector<std::string> lines;
      db.applied_event.connect([&lines](const collectible_event &e) {
         lines.push_back(fc::json::to_string(fc::variant(e, TROVE_MAX_NESTED_OBJECTS)));
      });

      replay_block_list blocks(1);
      collectible_create_operation create;
      create.owner = alice_id;
      blocks[0].push_back(create);
      replay_blocks(db, sequence, blocks);

      BOOST_REQUIRE_EQUAL(lines.size(), 1u);
      BOOST_CHECK(lines[0].find('\n') == std::string::npos);

      const fc::variant parsed = fc::json::from_string(lines[0]);
      const collectible_event event = parsed.as<collectible_event>(TROVE_MAX_NESTED_OBJECTS);
      BOOST_REQUIRE(event.is_type<collectible_created_event>());
      BOOST_CHECK(event.get<collectible_created_event>().owner == alice_id);
      BOOST_CHECK(db.find_collectible(event.get<collectible_created_event>().collectible) != nullptr);
   } FC_LOG_AND_RETHROW()
}

/**
 * Empty input applies nothing
 */
BOOST_AUTO_TEST_CASE( replay_empty ) {
   try {
      const replay_summary summary = replay_blocks(db, sequence, replay_block_list());
      BOOST_CHECK_EQUAL(summary.blocks, 0u);
      BOOST_CHECK_EQUAL(summary.applied, 0u);
      BOOST_CHECK_EQUAL(db.get_collectible_count(), 0u);
      BOOST_CHECK_EQUAL(sequence.head_block_num(), 1u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
