#include <gtest/gtest.h>

#include <strata/error.hpp>
#include <strata/expected.hpp>
#include <strata/log.hpp>
#include <strata/result.hpp>
#include <strata/src.hpp>

#include <future>
#include <string>
#include <system_error>

TEST(error_test, error_category_name_and_messages) {
  auto ec = strata::make_error_code(strata::error::not_open);
  EXPECT_STREQ(ec.category().name(), "strata");
  EXPECT_EQ(ec.message(), "resource not open");

  std::error_condition cond = strata::error_kind::timeout;
  EXPECT_STREQ(cond.category().name(), "strata.kind");
}

TEST(error_test, default_logger_is_named_strata) {
  auto l = strata::log::logger();
  ASSERT_TRUE(l);
  EXPECT_EQ(l->name(), "strata");
  EXPECT_FALSE(l->sinks().empty());
}

TEST(error_test, make_error_code_is_equatable) {
  auto ec1 = strata::make_error_code(strata::error::busy);
  auto ec2 = strata::make_error_code(strata::error::busy);
  auto ec3 = strata::make_error_code(strata::error::eof);

  EXPECT_EQ(ec1, ec2);
  EXPECT_NE(ec1, ec3);
}

TEST(error_test, codes_compare_equal_to_their_kind) {
  using strata::error;
  using strata::error_kind;

  EXPECT_EQ(std::error_code{error::eof}, error_kind::io);
  EXPECT_EQ(std::error_code{error::malformed_frame}, error_kind::decode);
  EXPECT_EQ(std::error_code{error::unencodable_frame}, error_kind::encode);
  EXPECT_EQ(std::error_code{error::request_timeout}, error_kind::timeout);
  EXPECT_EQ(std::error_code{error::idle_timeout}, error_kind::timeout);
  EXPECT_EQ(std::error_code{error::handshake_failed}, error_kind::handshake);
  EXPECT_EQ(std::error_code{error::rejected_during_shutdown}, error_kind::shutdown);
  EXPECT_EQ(std::error_code{error::call_without_ready}, error_kind::programming);
  EXPECT_EQ(std::error_code{error::operation_aborted}, error_kind::cancelled);

  EXPECT_NE(std::error_code{error::eof}, error_kind::timeout);
}

TEST(error_test, frame_too_large_is_both_decode_and_encode) {
  std::error_code ec = strata::error::frame_too_large;
  EXPECT_EQ(ec, strata::error_kind::decode);
  EXPECT_EQ(ec, strata::error_kind::encode);
  EXPECT_EQ(strata::kind_of(ec), strata::error_kind::decode);
}

TEST(error_test, foreign_codes_are_classified) {
  auto reset = std::make_error_code(std::errc::connection_reset);
  EXPECT_EQ(strata::kind_of(reset), strata::error_kind::io);
  EXPECT_EQ(reset, strata::error_kind::io);

  EXPECT_EQ(strata::kind_of(std::make_error_code(std::errc::timed_out)),
            strata::error_kind::timeout);

  // A service may return codes from its own category.
  auto ec = std::make_error_code(std::future_errc::broken_promise);
  EXPECT_EQ(strata::kind_of(ec), strata::error_kind::service);
}

TEST(error_test, fatal_kinds) {
  EXPECT_TRUE(strata::is_fatal(strata::error_kind::io));
  EXPECT_TRUE(strata::is_fatal(strata::error_kind::decode));
  EXPECT_TRUE(strata::is_fatal(strata::error_kind::handshake));
  EXPECT_TRUE(strata::is_fatal(strata::error_kind::timeout));
  EXPECT_FALSE(strata::is_fatal(strata::error_kind::service));
  EXPECT_FALSE(strata::is_fatal(strata::error_kind::cancelled));
}

TEST(error_test, result_helpers) {
  auto good = strata::ok();
  EXPECT_TRUE(good);

  auto bad = strata::fail(strata::error::timed_out);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), strata::error::timed_out);

  strata::result<std::string> r{std::string{"abc"}};
  auto len = r.transform([](std::string const& s) { return s.size(); });
  ASSERT_TRUE(len);
  EXPECT_EQ(*len, 3U);

  strata::result<int> e = strata::unexpected(strata::make_error_code(strata::error::eof));
  EXPECT_EQ(e.value_or(7), 7);
  auto chained = e.and_then([](int v) -> strata::result<int> { return v + 1; });
  ASSERT_FALSE(chained);
  EXPECT_EQ(chained.error(), strata::error::eof);
}
