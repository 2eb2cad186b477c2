/**
 * @file test_snapshot.cpp
 * @brief Unit tests for the snapshot model and quick key
 */

#include <clipsync/clipsync.h>
#include <gtest/gtest.h>

using namespace clipsync;

class SnapshotTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(security_init().is_ok()); }

  static Item text_item(const std::string &text) {
    return Item::from_bytes(13, Bytes(text.begin(), text.end()),
                            "CF_UNICODETEXT", "text/plain");
  }
};

// ============================================================================
// Quick Key
// ============================================================================

TEST_F(SnapshotTest, QuickKeyEmpty) {
  EXPECT_EQ(quick_key({}), "empty");

  Snapshot snap;
  snap.stamp_quick_key();
  EXPECT_EQ(snap.qkey, EMPTY_QUICK_KEY);
}

TEST_F(SnapshotTest, QuickKeyDeterministic) {
  std::vector<Item> a = {text_item("hello")};
  std::vector<Item> b = {text_item("hello")};

  EXPECT_EQ(quick_key(a), quick_key(b));
  EXPECT_EQ(quick_key(a).size(), QUICK_KEY_BYTES * 2);
}

TEST_F(SnapshotTest, QuickKeyDependsOnPayload) {
  EXPECT_NE(quick_key({text_item("hello")}), quick_key({text_item("hellO")}));
}

TEST_F(SnapshotTest, QuickKeyIgnoresMetadata) {
  Item plain = text_item("same");
  Item renamed = plain;
  renamed.fmt = 99;
  renamed.fmt_name = "Other";

  EXPECT_EQ(quick_key({plain}), quick_key({renamed}));
}

TEST_F(SnapshotTest, QuickKeyOverConcatenation) {
  // SHA-256 of "aGk=" (base64 of "hi"), first 8 bytes
  std::vector<Item> items = {text_item("hi")};
  EXPECT_EQ(items[0].payload, "aGk=");

  Sha256Digest digest = sha256(reinterpret_cast<const Byte *>("aGk="), 4);
  EXPECT_EQ(quick_key(items), to_hex(digest.data(), 8));
}

// ============================================================================
// Item
// ============================================================================

TEST_F(SnapshotTest, ItemFromBytes) {
  Bytes data = {0x89, 'P', 'N', 'G', 0x00, 0xFF};
  Item item = Item::from_bytes(0xC001, data, "PNG", "image/png");

  EXPECT_EQ(item.fmt, 0xC001u);
  EXPECT_EQ(item.byte_len, data.size());

  auto decoded = item.decode_payload();
  ASSERT_TRUE(decoded.is_ok());
  EXPECT_EQ(decoded.value(), data);
}

TEST_F(SnapshotTest, ItemDecodeInvalidPayload) {
  Item item;
  item.payload = "not base64!!";
  auto decoded = item.decode_payload();
  ASSERT_TRUE(decoded.is_error());
  EXPECT_EQ(decoded.error().code, ErrorCode::MalformedMessage);
}

// ============================================================================
// JSON
// ============================================================================

TEST_F(SnapshotTest, JsonRoundTrip) {
  Snapshot snap;
  snap.origin = "a1b2c3d4";
  snap.ts = 1700000000;
  snap.items = {text_item("hello"),
                Item::from_bytes(0xC001, Bytes{1, 2, 3}, "PNG", "image/png")};
  snap.stamp_quick_key();

  auto parsed = Snapshot::from_json(snap.to_json());
  ASSERT_TRUE(parsed.is_ok());
  EXPECT_EQ(parsed.value().origin, snap.origin);
  EXPECT_EQ(parsed.value().ts, snap.ts);
  EXPECT_EQ(parsed.value().qkey, snap.qkey);
  EXPECT_EQ(parsed.value().items, snap.items);
}

TEST_F(SnapshotTest, JsonOmitsEmptyOptionalFields) {
  Snapshot snap;
  snap.origin = "x";
  snap.items = {Item::from_bytes(13, Bytes{'a'})};

  std::string text = snap.to_json();
  EXPECT_EQ(text.find("fmt_name"), std::string::npos);
  EXPECT_EQ(text.find("mime_type"), std::string::npos);
  EXPECT_NE(text.find("\"byte_len\":1"), std::string::npos);
}

TEST_F(SnapshotTest, JsonToleratesMissingFields) {
  auto parsed = Snapshot::from_json(
      std::string(R"({"origin":"peer","items":[{"fmt":13,"payload":"aGk="}]})"));
  ASSERT_TRUE(parsed.is_ok());

  const Snapshot &snap = parsed.value();
  EXPECT_EQ(snap.origin, "peer");
  EXPECT_EQ(snap.ts, 0);
  EXPECT_TRUE(snap.qkey.empty());
  ASSERT_EQ(snap.items.size(), 1u);
  EXPECT_TRUE(snap.items[0].fmt_name.empty());
  EXPECT_TRUE(snap.items[0].mime_type.empty());
}

TEST_F(SnapshotTest, JsonNullItems) {
  auto parsed = Snapshot::from_json(
      std::string(R"({"origin":"peer","ts":5,"items":null,"qkey":"empty"})"));
  ASSERT_TRUE(parsed.is_ok());
  EXPECT_TRUE(parsed.value().empty());
}

TEST_F(SnapshotTest, JsonMalformed) {
  auto garbage = Snapshot::from_json(std::string("{not json"));
  ASSERT_TRUE(garbage.is_error());
  EXPECT_EQ(garbage.error().code, ErrorCode::MalformedMessage);

  auto array = Snapshot::from_json(std::string("[1,2]"));
  ASSERT_TRUE(array.is_error());
  EXPECT_EQ(array.error().code, ErrorCode::MalformedMessage);

  auto wrong_type = Snapshot::from_json(std::string(R"({"origin":12})"));
  ASSERT_TRUE(wrong_type.is_error());
  EXPECT_EQ(wrong_type.error().code, ErrorCode::MalformedMessage);
}

TEST_F(SnapshotTest, JsonFromBytes) {
  std::string text = R"({"origin":"o","ts":1,"items":[],"qkey":"empty"})";
  auto parsed = Snapshot::from_json(Bytes(text.begin(), text.end()));
  ASSERT_TRUE(parsed.is_ok());
  EXPECT_EQ(parsed.value().origin, "o");
}
