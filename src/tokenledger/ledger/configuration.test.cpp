// NOLINTBEGIN

#include <gtest/gtest.h>

#include <tokenledger/ledger/configuration.hpp>
#include <tokenledger/log.hpp>

#include <filesystem>
#include <fstream>

using tokenledger::ledger::ledger_errc;

class configuration: public ::testing::Test
{
protected:
  void SetUp() override
  {
    tokenledger::log::initialize();
  }
};

TEST_F( configuration, defaults )
{
  auto config = tokenledger::ledger::configuration::from_yaml( YAML::Node() );
  ASSERT_TRUE( config );
  EXPECT_EQ( config->name, "Token" );
  EXPECT_EQ( config->symbol, "TOKEN" );
  EXPECT_EQ( config->base_uri, "" );

  config = tokenledger::ledger::configuration::from_yaml( YAML::Load( "other:\n  key: value\n" ) );
  ASSERT_TRUE( config );
  EXPECT_EQ( config->name, "Token" );
}

TEST_F( configuration, from_yaml )
{
  auto config = tokenledger::ledger::configuration::from_yaml(
    YAML::Load( "ledger:\n  name: MyContract\n  symbol: MC\n  base-uri: https://example.com/token/\n" ) );

  ASSERT_TRUE( config );
  EXPECT_EQ( config->name, "MyContract" );
  EXPECT_EQ( config->symbol, "MC" );
  EXPECT_EQ( config->base_uri, "https://example.com/token/" );

  config = tokenledger::ledger::configuration::from_yaml( YAML::Load( "ledger:\n  symbol: MC\n" ) );
  ASSERT_TRUE( config );
  EXPECT_EQ( config->name, "Token" );
  EXPECT_EQ( config->symbol, "MC" );
}

TEST_F( configuration, invalid )
{
  auto config = tokenledger::ledger::configuration::from_yaml( YAML::Load( "ledger:\n  name: [ a, b ]\n" ) );
  ASSERT_FALSE( config );
  EXPECT_EQ( config.error(), ledger_errc::invalid_configuration );

  config = tokenledger::ledger::configuration::from_yaml( YAML::Load( "ledger: scalar\n" ) );
  ASSERT_FALSE( config );
  EXPECT_EQ( config.error(), ledger_errc::invalid_configuration );

  config = tokenledger::ledger::configuration::from_yaml( YAML::Load( "- a\n- b\n" ) );
  ASSERT_FALSE( config );
  EXPECT_EQ( config.error(), ledger_errc::invalid_configuration );
}

TEST_F( configuration, from_file )
{
  auto path = std::filesystem::temp_directory_path() / "tokenledger_configuration_test.yml";

  {
    std::ofstream file( path );
    file << "ledger:\n  name: FileContract\n  symbol: FC\n";
  }

  auto config = tokenledger::ledger::configuration::from_file( path );
  std::filesystem::remove( path );

  ASSERT_TRUE( config );
  EXPECT_EQ( config->name, "FileContract" );
  EXPECT_EQ( config->symbol, "FC" );

  config = tokenledger::ledger::configuration::from_file( path );
  ASSERT_FALSE( config );
  EXPECT_EQ( config.error(), ledger_errc::invalid_configuration );
}

// NOLINTEND
