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
#include <trove/chain/replay.hpp>
#include <trove/chain/simple_host.hpp>
#include <trove/protocol/config.hpp>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant.hpp>

#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace trove::chain;
namespace bpo = boost::program_options;

namespace {

   typedef std::vector<std::pair<account_id_type, share_type>> balance_list;

   void print_event(const collectible_event &event) {
      std::cout << fc::json::to_string(fc::variant(event, TROVE_MAX_NESTED_OBJECTS)) << std::endl;
   }

}

int main(int argc, char **argv) {
   try {
      bpo::options_description cli_options("Command line options");
      cli_options.add_options()
         ("help,h", "Print this help message and exit.")
         ("config-file,c", bpo::value<std::string>(), "Path to an ini-style configuration file")
         ;

      bpo::options_description replay_options("Replay options");
      replay_options.add_options()
         ("maximum-owned", bpo::value<uint32_t>()->default_value(TROVE_DEFAULT_MAXIMUM_OWNED),
          "Maximum number of collectibles an account may hold")
         ("seed", bpo::value<std::string>()->default_value("trove"),
          "Seed of the deterministic entropy source")
         ("balances", bpo::value<std::string>(),
          "JSON file with the opening balances, as [[account, amount], ...]")
         ("operations", bpo::value<std::string>(),
          "JSON file with the blocks to apply, each an array of operations")
         ;

      bpo::options_description all_options;
      all_options.add(cli_options).add(replay_options);

      bpo::variables_map options;
      try {
         bpo::store(bpo::parse_command_line(argc, argv, all_options), options);
         if (options.count("config-file")) {
            const std::string config_path = options["config-file"].as<std::string>();
            std::ifstream config_file(config_path);
            FC_ASSERT(config_file, "Unable to open configuration file ${f}", ("f", config_path));
            bpo::store(bpo::parse_config_file(config_file, replay_options), options);
         }
         bpo::notify(options);
      } catch (const bpo::error &e) {
         std::cerr << "Error parsing command line: " << e.what() << "\n";
         return 1;
      }

      if (options.count("help")) {
         std::cout << all_options << "\n";
         return 0;
      }

      if (!options.count("operations")) {
         std::cerr << "Missing --operations\n" << all_options << "\n";
         return 1;
      }

      chain_parameters params;
      params.maximum_owned = options["maximum-owned"].as<uint32_t>();

      in_memory_balance_ledger ledger;
      if (options.count("balances")) {
         const fc::path balances_path(options["balances"].as<std::string>());
         const auto balances = fc::json::from_file(balances_path).as<balance_list>(TROVE_MAX_NESTED_OBJECTS);
         for (const auto &entry : balances)
            ledger.adjust_balance(entry.first, entry.second);
         ilog("Loaded ${n} opening balances", ("n", balances.size()));
      }

      seeded_entropy_source entropy(options["seed"].as<std::string>());
      block_sequence sequence;

      const fc::path operations_path(options["operations"].as<std::string>());
      const auto blocks = fc::json::from_file(operations_path).as<replay_block_list>(TROVE_MAX_NESTED_OBJECTS);

      database db(params, ledger, entropy, sequence);
      db.applied_event.connect(&print_event);

      const replay_summary summary = replay_blocks(db, sequence, blocks);

      ilog("Replayed ${b} blocks: ${a} operations applied, ${r} rejected, ${c} collectibles",
           ("b", summary.blocks)("a", summary.applied)("r", summary.rejected)("c", db.get_collectible_count()));
      return 0;
   } catch (const fc::exception &e) {
      elog("Replay failed: ${e}", ("e", e.to_detail_string()));
   } catch (const std::exception &e) {
      elog("Replay failed: ${e}", ("e", e.what()));
   }
   return 1;
}
