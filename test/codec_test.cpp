#include <gtest/gtest.h>

#include <strata/buffer.hpp>
#include <strata/codec.hpp>
#include <strata/error.hpp>
#include <strata/src.hpp>

#include <string>
#include <vector>

namespace strata::test {

namespace {

auto raw(std::initializer_list<unsigned char> bytes) -> std::string {
  return std::string(bytes.begin(), bytes.end());
}

template <class Codec>
auto decode_all(Codec& c, byte_buffer& b) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (;;) {
    auto r = c.decode(b);
    EXPECT_TRUE(r);
    if (!r || !*r) break;
    out.push_back((*r)->to_string());
  }
  return out;
}

}  // namespace

TEST(codec_test, length_prefixed_waits_for_header_and_payload) {
  length_prefixed_codec c{1};
  byte_buffer b;

  ASSERT_FALSE(b.append(raw({0x03})));
  auto r = c.decode(b);
  ASSERT_TRUE(r);
  EXPECT_FALSE(*r);
  EXPECT_EQ(b.size(), 1U);

  ASSERT_FALSE(b.append("abc"));
  r = c.decode(b);
  ASSERT_TRUE(r);
  ASSERT_TRUE(*r);
  EXPECT_EQ(**r, "abc");
  EXPECT_TRUE(b.empty());
}

TEST(codec_test, length_prefixed_decodes_back_to_back_frames) {
  length_prefixed_codec c{1};
  byte_buffer b;
  ASSERT_FALSE(b.append(raw({0x02, 'x', 'y', 0x01, 'z'})));
  EXPECT_EQ(decode_all(c, b), (std::vector<std::string>{"xy", "z"}));
}

TEST(codec_test, length_prefixed_chunk_independence) {
  std::string wire;
  {
    length_prefixed_codec c{2};
    byte_buffer out;
    for (auto s : {"alpha", "", "beta", "gamma-delta"}) {
      ASSERT_FALSE(c.encode(buffer_view::copy_of(std::string_view{s}), out));
    }
    wire = out.share(0, out.size()).to_string();
  }

  // Any split of the byte stream yields the same frames.
  for (std::size_t chunk = 1; chunk <= wire.size(); ++chunk) {
    length_prefixed_codec c{2};
    byte_buffer b;
    std::vector<std::string> frames;
    for (std::size_t off = 0; off < wire.size(); off += chunk) {
      ASSERT_FALSE(b.append(std::string_view{wire}.substr(off, chunk)));
      auto part = decode_all(c, b);
      frames.insert(frames.end(), part.begin(), part.end());
    }
    EXPECT_EQ(frames, (std::vector<std::string>{"alpha", "", "beta", "gamma-delta"}))
      << "chunk=" << chunk;
  }
}

TEST(codec_test, length_prefixed_rejects_oversized_frames) {
  length_prefixed_codec c{2, 8};
  byte_buffer b;
  ASSERT_FALSE(b.append(raw({0x00, 0x09})));
  auto r = c.decode(b);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), error::frame_too_large);
  EXPECT_EQ(r.error(), error_kind::decode);

  byte_buffer out;
  auto ec = c.encode(buffer_view::copy_of(std::string_view{"123456789"}), out);
  EXPECT_EQ(ec, error::frame_too_large);
  EXPECT_EQ(ec, error_kind::encode);
  EXPECT_TRUE(out.empty());
}

TEST(codec_test, encode_reports_would_block_on_a_full_buffer) {
  length_prefixed_codec c{1};
  byte_buffer out{8};
  ASSERT_FALSE(c.encode(buffer_view::copy_of(std::string_view{"abcd"}), out));
  EXPECT_EQ(c.encode(buffer_view::copy_of(std::string_view{"abcd"}), out), error::would_block);
  EXPECT_EQ(out.size(), 5U);
}

TEST(codec_test, decoded_frame_is_a_view_into_the_read_buffer) {
  length_prefixed_codec c{1};
  byte_buffer b;
  ASSERT_FALSE(b.append(raw({0x02, 'o', 'k'})));
  auto r = c.decode(b);
  ASSERT_TRUE(r && *r);
  EXPECT_TRUE(b.owns(**r));
  EXPECT_EQ(b.live_views(), 1U);
}

TEST(codec_test, line_codec_strips_terminators) {
  line_codec c{16};
  byte_buffer b;
  ASSERT_FALSE(b.append("one\r\ntwo\nthr"));
  EXPECT_EQ(decode_all(c, b), (std::vector<std::string>{"one", "two"}));
  ASSERT_FALSE(b.append("ee\n"));
  EXPECT_EQ(decode_all(c, b), (std::vector<std::string>{"three"}));
}

TEST(codec_test, line_codec_limits) {
  line_codec c{4};
  byte_buffer b;
  ASSERT_FALSE(b.append("toolong"));
  auto r = c.decode(b);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), error::frame_too_large);

  byte_buffer out;
  EXPECT_EQ(c.encode(buffer_view::copy_of(std::string_view{"a\nb"}), out),
            error::unencodable_frame);
  ASSERT_FALSE(c.encode(buffer_view::copy_of(std::string_view{"ab"}), out));
  EXPECT_EQ(out.share(0, out.size()), "ab\n");
}

TEST(codec_test, correlated_codec_carries_ids) {
  correlated_codec<length_prefixed_codec> c{length_prefixed_codec{1}};
  byte_buffer b;
  ASSERT_FALSE(c.encode({7, buffer_view::copy_of(std::string_view{"pong"})}, b));
  EXPECT_EQ(b.size(), 1U + 4U + 4U);

  auto r = c.decode(b);
  ASSERT_TRUE(r && *r);
  EXPECT_EQ((*r)->id, 7U);
  EXPECT_EQ((*r)->value, "pong");
}

TEST(codec_test, correlated_codec_rejects_short_frames) {
  correlated_codec<length_prefixed_codec> c{length_prefixed_codec{1}};
  byte_buffer b;
  ASSERT_FALSE(b.append(raw({0x02, 0x00, 0x01})));
  auto r = c.decode(b);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), error::malformed_frame);
}

TEST(codec_test, bytes_codec_passes_everything_through) {
  bytes_codec c;
  byte_buffer b;
  ASSERT_FALSE(b.append("raw"));
  auto r = c.decode(b);
  ASSERT_TRUE(r && *r);
  EXPECT_EQ(**r, "raw");
  r = c.decode(b);
  ASSERT_TRUE(r);
  EXPECT_FALSE(*r);
}

static_assert(strata::codec<length_prefixed_codec>);
static_assert(strata::codec<line_codec>);
static_assert(strata::codec<correlated_codec<line_codec>>);

}  // namespace strata::test
