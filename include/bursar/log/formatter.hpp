#pragma once

#include <quill/DeferredFormatCodec.h>

#include <bursar/currency/cents.hpp>

template<>
struct fmtquill::formatter< bursar::currency::cents >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const bursar::currency::cents& c, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", bursar::currency::to_display_string( c ) );
  }
};

template<>
struct quill::Codec< bursar::currency::cents >: quill::DeferredFormatCodec< bursar::currency::cents >
{};
