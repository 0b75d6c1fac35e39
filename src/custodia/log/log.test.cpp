// NOLINTBEGIN

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <string>

#include <quill/bundled/fmt/format.h>

#include <custodia/log.hpp>

TEST( log, set_level )
{
  auto logger = custodia::log::instance();
  ASSERT_NE( logger, nullptr );
  EXPECT_EQ( logger, custodia::log::instance() );

  EXPECT_TRUE( custodia::log::set_level( "debug" ) );
  EXPECT_EQ( logger->get_log_level(), quill::LogLevel::Debug );

  EXPECT_TRUE( custodia::log::set_level( "warning" ) );
  EXPECT_EQ( logger->get_log_level(), quill::LogLevel::Warning );

  EXPECT_FALSE( custodia::log::set_level( "loudest" ) );
  EXPECT_EQ( logger->get_log_level(), quill::LogLevel::Warning );

  EXPECT_TRUE( custodia::log::set_level( "info" ) );
}

TEST( log, binary_formatters )
{
  custodia::log::initialize();

  std::array< std::byte, 3 > data{ std::byte{ 0x00 }, std::byte{ 0x01 }, std::byte{ 0xff } };

  EXPECT_EQ( fmtquill::format( "{}", custodia::log::hex{ data.data(), data.size() } ), "0x0001ff" );
  EXPECT_EQ( fmtquill::format( "{}", custodia::log::base58{ data.data(), data.size() } ), "19p" );
  EXPECT_EQ( fmtquill::format( "{}", custodia::log::hex{ data.data(), 0 } ), "0x" );

  LOG_INFO( custodia::log::instance(), "hex {}", custodia::log::hex{ data.data(), data.size() } );
  LOG_INFO( custodia::log::instance(), "base58 {}", custodia::log::base58{ data.data(), data.size() } );
  custodia::log::instance()->flush_log();
}

// NOLINTEND
