/**************************************************************************/
/*                                                                        */
/*                   zlink - terminal file transfer engine                */
/*             Copyright (C)2025-2026, zlink developers                   */
/*                                                                        */
/*    Licensed  under the  Apache License, Version  2.0 (the "License");  */
/*    you may not use this  file  except in compliance with the License.  */
/*    You may obtain a copy of the License at                             */
/*                                                                        */
/*                http://www.apache.org/licenses/LICENSE-2.0              */
/*                                                                        */
/*    Unless  required  by  applicable  law  or agreed to  in  writing,   */
/*    software  distributed  under  the  License  is  distributed on an   */
/*    "AS IS"  BASIS, WITHOUT  WARRANTIES  OR  CONDITIONS OF ANY  KIND,   */
/*    either  express  or implied.  See  the  License for  the specific   */
/*    language governing permissions and limitations under the License.   */
/**************************************************************************/
#include "gtest/gtest.h"
#include "zmodem/frame.h"
#include "zmodem/handshake.h"
#include "zmodem_test/fakes.h"

#include <string>

using namespace zlink::zmodem;

static const std::string kZdle(1, static_cast<char>(ZDLE));

TEST(FindHandshakeTest, NoMatch) {
  EXPECT_FALSE(FindHandshake("").has_value());
  EXPECT_FALSE(FindHandshake("hello world **").has_value());
  EXPECT_FALSE(FindHandshake("**" + kZdle + "B02").has_value());
}

TEST(FindHandshakeTest, Download) {
  const auto m = FindHandshake("rz waiting\r\n**" + kZdle + "B00000000000000\r\n");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(TransferDirection::download, m->direction);
  EXPECT_EQ(12u, m->offset);
  EXPECT_EQ(6u, m->length);
}

TEST(FindHandshakeTest, Upload) {
  const auto m = FindHandshake(EncodeHeader(FrameType::ZRINIT, CANFDX, FrameEncoding::hex));
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(TransferDirection::upload, m->direction);
  EXPECT_EQ(0u, m->offset);
}

TEST(FindHandshakeTest, TwoPads) {
  // The one pad form matches one byte later.
  const auto m = FindHandshake("x**" + kZdle + "B00");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(1u, m->offset);
  EXPECT_EQ(6u, m->length);
}

TEST(FindHandshakeTest, EarliestWins) {
  const auto m = FindHandshake("**B01 then **" + kZdle + "B00");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(TransferDirection::upload, m->direction);
  EXPECT_EQ(0u, m->offset);
  EXPECT_EQ(5u, m->length);
}

TEST(FindHandshakeTest, Variants) {
  for (const auto& p : HandshakePatterns()) {
    const auto m = FindHandshake("$ " + p.bytes + "0000");
    ASSERT_TRUE(m.has_value()) << p.name;
    EXPECT_EQ(p.direction, m->direction) << p.name;
  }
}

TEST(PartialHandshakeLengthTest, Basic) {
  EXPECT_EQ(0u, PartialHandshakeLength(""));
  EXPECT_EQ(0u, PartialHandshakeLength("hello"));
  EXPECT_EQ(2u, PartialHandshakeLength("$ *" + kZdle));
  EXPECT_EQ(3u, PartialHandshakeLength("$ **" + kZdle));
  EXPECT_EQ(5u, PartialHandshakeLength("$ **" + kZdle + "B0"));
  EXPECT_EQ(4u, PartialHandshakeLength("**B0"));
  EXPECT_EQ(0u, PartialHandshakeLength("**" + kZdle + "B02"));
}

TEST(PartialHandshakeLengthTest, PadsAloneAreNotHeld) {
  EXPECT_EQ(0u, PartialHandshakeLength("Password: *"));
  EXPECT_EQ(0u, PartialHandshakeLength("Password: ****"));
}

TEST(HandshakeDetectorTest, SingleChunk) {
  HandshakeDetector d;
  EXPECT_EQ("hello ", d.Scan("hello ").display);
  const auto r = d.Scan("$ sz foo\r\n**" + kZdle + "B00000000000000\r\n");
  ASSERT_TRUE(r.detection.has_value());
  EXPECT_EQ(TransferDirection::download, r.detection->direction);
  EXPECT_EQ("$ sz foo\r\n", r.display);
  EXPECT_EQ("000000000000\r\n", r.detection->after);
  EXPECT_EQ(0u, d.buffered());
}

TEST(HandshakeDetectorTest, HoldsPartialMarker) {
  HandshakeDetector d;
  auto r = d.Scan("$ **" + kZdle + "B");
  EXPECT_FALSE(r.detection.has_value());
  EXPECT_EQ("$ ", r.display);
  EXPECT_EQ("**" + kZdle + "B", d.held());

  r = d.Scan("00000000000000\r\n");
  ASSERT_TRUE(r.detection.has_value());
  EXPECT_TRUE(r.display.empty());
  EXPECT_EQ("000000000000\r\n", r.detection->after);
  EXPECT_TRUE(d.held().empty());
}

TEST(HandshakeDetectorTest, ReleasesHeldBytes) {
  HandshakeDetector d;
  EXPECT_EQ("x", d.Scan("x**" + kZdle).display);
  const auto r = d.Scan("Bye");
  EXPECT_FALSE(r.detection.has_value());
  EXPECT_EQ("**" + kZdle + "Bye", r.display);
  EXPECT_TRUE(d.held().empty());
}

TEST(HandshakeDetectorTest, PadsAreShownAtOnce) {
  HandshakeDetector d;
  EXPECT_EQ("Password: *", d.Scan("Password: *").display);
  EXPECT_EQ("*", d.Scan("*").display);
  EXPECT_TRUE(d.held().empty());
}

TEST(HandshakeDetectorTest, SplitAtEveryBoundary) {
  const auto stream = "prompt$ **" + kZdle + "B0100000000\r\ntail";
  const auto marker_start = stream.find("**");
  const auto marker_end = stream.find("B01") + 3;
  for (size_t split = 1; split < stream.size(); split++) {
    HandshakeDetector d;
    const auto first = stream.substr(0, split);
    const auto second = stream.substr(split);
    auto r = d.Scan(first);
    if (split >= marker_end) {
      ASSERT_TRUE(r.detection.has_value()) << "split: " << split;
      EXPECT_EQ("prompt$ ", r.display) << "split: " << split;
      EXPECT_EQ(stream.substr(marker_end, split - marker_end), r.detection->after)
          << "split: " << split;
      continue;
    }
    ASSERT_FALSE(r.detection.has_value()) << "split: " << split;
    auto shown = r.display;
    r = d.Scan(second);
    ASSERT_TRUE(r.detection.has_value()) << "split: " << split;
    shown += r.display;
    EXPECT_EQ(TransferDirection::upload, r.detection->direction);
    EXPECT_EQ(stream.substr(marker_end), r.detection->after) << "split: " << split;
    // Only a bare run of pads reaches the display before the marker completes.
    const auto expected_shown = split > marker_start && split <= marker_start + 2
                                    ? stream.substr(0, split)
                                    : std::string("prompt$ ");
    EXPECT_EQ(expected_shown, shown) << "split: " << split;
  }
}

TEST(HandshakeDetectorTest, OneByteAtATime) {
  const auto stream = "abc**" + kZdle + "B00xyz";
  HandshakeDetector d;
  std::optional<Detection> found;
  std::string shown;
  size_t at = 0;
  for (size_t i = 0; i < stream.size() && !found; i++) {
    auto r = d.Scan(stream.substr(i, 1));
    shown += r.display;
    found = r.detection;
    at = i;
  }
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(stream.find("B00") + 2, at);
  EXPECT_EQ("abc**", shown);
  EXPECT_TRUE(found->after.empty());
}

TEST(HandshakeDetectorTest, WindowIsBounded) {
  HandshakeDetector d(32);
  d.Scan(std::string(1000, 'x'));
  EXPECT_EQ(32u, d.buffered());
  d.Scan("more");
  EXPECT_EQ(32u, d.buffered());
  d.Reset();
  EXPECT_EQ(0u, d.buffered());
}
