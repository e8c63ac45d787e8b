#pragma once

#include <tokenledger/ledger/error.hpp>

#include <filesystem>
#include <string>

#include <yaml-cpp/yaml.h>

namespace tokenledger::ledger {

/**
 * Collection level metadata. Read from the `ledger` section of a YAML
 * document:
 *
 *   ledger:
 *     name: Token
 *     symbol: TOKEN
 *     base-uri: https://example.com/token/
 */
struct configuration
{
  std::string name   = "Token";
  std::string symbol = "TOKEN";
  std::string base_uri;

  static result< configuration > from_yaml( const YAML::Node& document );
  static result< configuration > from_file( const std::filesystem::path& p );
};

} // namespace tokenledger::ledger
