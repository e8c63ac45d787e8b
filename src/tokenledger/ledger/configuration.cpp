#include <tokenledger/ledger/configuration.hpp>

#include <string_view>

#include <tokenledger/log.hpp>

namespace tokenledger::ledger {

namespace constants {

using namespace std::string_view_literals;

constexpr auto ledger_section  = "ledger"sv;
constexpr auto name_option     = "name"sv;
constexpr auto symbol_option   = "symbol"sv;
constexpr auto base_uri_option = "base-uri"sv;

} // namespace constants

static std::error_code read_option( const YAML::Node& section, std::string_view key, std::string& value )
{
  const auto node = section[ std::string( key ) ];
  if( !node )
    return ledger_errc::ok;

  if( !node.IsScalar() )
  {
    LOG_ERROR( log::instance(), "Configuration option '{}' must be a scalar", key );
    return ledger_errc::invalid_configuration;
  }

  value = node.as< std::string >();
  return ledger_errc::ok;
}

result< configuration > configuration::from_yaml( const YAML::Node& document )
{
  configuration config;

  try
  {
    if( !document || document.IsNull() )
      return config;

    if( !document.IsMap() )
      return std::unexpected( ledger_errc::invalid_configuration );

    const auto section = document[ std::string( constants::ledger_section ) ];
    if( !section )
      return config;

    if( !section.IsMap() )
      return std::unexpected( ledger_errc::invalid_configuration );

    if( auto ec = read_option( section, constants::name_option, config.name ); ec )
      return std::unexpected( ec );

    if( auto ec = read_option( section, constants::symbol_option, config.symbol ); ec )
      return std::unexpected( ec );

    if( auto ec = read_option( section, constants::base_uri_option, config.base_uri ); ec )
      return std::unexpected( ec );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Unable to read ledger configuration: {}", e.what() );
    return std::unexpected( ledger_errc::invalid_configuration );
  }

  return config;
}

result< configuration > configuration::from_file( const std::filesystem::path& p )
{
  YAML::Node document;

  try
  {
    document = YAML::LoadFile( p.string() );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Unable to load configuration file {}: {}", p.string(), e.what() );
    return std::unexpected( ledger_errc::invalid_configuration );
  }

  return from_yaml( document );
}

} // namespace tokenledger::ledger
