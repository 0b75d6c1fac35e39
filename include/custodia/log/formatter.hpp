#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <custodia/encode.hpp>

namespace custodia::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

struct base58_tag
{};

using base58 = quill::BinaryData< base58_tag >;

} // namespace custodia::log

template<>
struct fmtquill::formatter< custodia::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const custodia::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                custodia::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< custodia::log::hex >: quill::BinaryDataDeferredFormatCodec< custodia::log::hex >
{};

template<>
struct fmtquill::formatter< custodia::log::base58 >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const custodia::log::base58& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                custodia::encode::to_base58( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< custodia::log::base58 >: quill::BinaryDataDeferredFormatCodec< custodia::log::base58 >
{};
