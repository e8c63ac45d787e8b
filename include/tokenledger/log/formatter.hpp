#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <tokenledger/encode.hpp>

namespace tokenledger::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace tokenledger::log

template<>
struct fmtquill::formatter< tokenledger::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tokenledger::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                tokenledger::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< tokenledger::log::hex >: quill::BinaryDataDeferredFormatCodec< tokenledger::log::hex >
{};
