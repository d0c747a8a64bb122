#include <gtest/gtest.h>

#include <quill/core/LogLevel.h>

#include <bursar/log.hpp>

TEST( log, cents_formatter )
{
  using bursar::currency::cents;

  EXPECT_EQ( fmtquill::format( "{}", cents{ 0 } ), "$0.00" );
  EXPECT_EQ( fmtquill::format( "{}", cents{ 4'023 } ), "$40.23" );
  EXPECT_EQ( fmtquill::format( "balance {}", cents{ 5 } ), "balance $0.05" );
}

TEST( log, set_level )
{
  auto* logger = bursar::log::instance();
  ASSERT_NE( logger, nullptr );
  EXPECT_EQ( logger, bursar::log::instance() );

  EXPECT_TRUE( bursar::log::set_level( "warning" ) );
  EXPECT_EQ( logger->get_log_level(), quill::LogLevel::Warning );

  EXPECT_FALSE( bursar::log::set_level( "loud" ) );
  EXPECT_EQ( logger->get_log_level(), quill::LogLevel::Warning );

  EXPECT_TRUE( bursar::log::set_level( "info" ) );
  EXPECT_EQ( logger->get_log_level(), quill::LogLevel::Info );
}
