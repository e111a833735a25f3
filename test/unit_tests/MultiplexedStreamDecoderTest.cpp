#include "MultiplexedStreamDecoder.hpp"

#include "ScriptedBodyReader.hpp"
#include "TestHeaders.hpp"

using namespace dw;

TEST_CASE("MultiplexedFrame header layout", "[MultiplexedStreamDecoder]") {
  string frame = MultiplexedFrame::encode(StreamId::STDERR, string(258, 'e'));
  REQUIRE(frame.length() == 8 + 258);
  REQUIRE(frame[0] == 2);
  REQUIRE(frame[1] == 0);
  REQUIRE(frame[2] == 0);
  REQUIRE(frame[3] == 0);
  REQUIRE(frame[4] == 0);
  REQUIRE(frame[5] == 0);
  REQUIRE(frame[6] == 1);
  REQUIRE(frame[7] == 2);
}

TEST_CASE("MultiplexedStreamDecoder round trip", "[MultiplexedStreamDecoder]") {
  vector<StreamEvent> expected = {
      StreamEvent::fromFrame(StreamId::STDOUT, "hello\n"),
      StreamEvent::fromFrame(StreamId::STDERR, ""),
      StreamEvent::fromFrame(StreamId::STDERR, "warning: x\n"),
      StreamEvent::fromFrame(StreamId::STDOUT, string("\0\x01\xff", 3)),
      StreamEvent::fromFrame(StreamId::STDIN, string(70000, 'z')),
      StreamEvent::fromFrame(StreamId::STDOUT, ""),
  };
  string wire;
  for (const auto& event : expected) {
    wire += MultiplexedFrame::encode(event.getStreamId(), event.getPayload());
  }

  for (int trial = 0; trial < 20; trial++) {
    MultiplexedStreamDecoder decoder(ScriptedBodyReader::of(
        ScriptedBodyReader::randomSplit(wire, 1 + trial * 997)));
    vector<StreamEvent> decoded;
    StreamEvent event;
    while (decoder.next(&event)) {
      REQUIRE(event.getType() == StreamEvent::FRAME);
      decoded.push_back(event);
    }
    REQUIRE(decoded == expected);
  }
}

TEST_CASE("MultiplexedStreamDecoder framing errors",
          "[MultiplexedStreamDecoder]") {
  StreamEvent event;

  SECTION("Empty body ends immediately") {
    MultiplexedStreamDecoder decoder(ScriptedBodyReader::of({}));
    REQUIRE_FALSE(decoder.next(&event));
  }

  SECTION("Truncated header") {
    MultiplexedStreamDecoder decoder(
        ScriptedBodyReader::of({string("\x01\0\0\0\0", 5)}));
    REQUIRE_THROWS_AS(decoder.next(&event), DecodeError);
  }

  SECTION("Truncated payload") {
    string frame = MultiplexedFrame::encode(StreamId::STDOUT, "0123456789");
    MultiplexedStreamDecoder decoder(
        ScriptedBodyReader::of({frame.substr(0, 12)}));
    REQUIRE_THROWS_AS(decoder.next(&event), DecodeError);
  }

  SECTION("Unknown stream id") {
    string frame = MultiplexedFrame::encode(StreamId::STDOUT, "x");
    frame[0] = 7;
    MultiplexedStreamDecoder decoder(ScriptedBodyReader::of({frame}));
    REQUIRE_THROWS_AS(decoder.next(&event), DecodeError);
  }

  SECTION("Oversized frame") {
    string frame = MultiplexedFrame::encode(StreamId::STDOUT, string(64, 'x'));
    MultiplexedStreamDecoder decoder(ScriptedBodyReader::of({frame}), 16);
    REQUIRE_THROWS_AS(decoder.next(&event), DecodeError);
  }

  SECTION("Connection failure mid-stream") {
    string frame = MultiplexedFrame::encode(StreamId::STDOUT, "first");
    MultiplexedStreamDecoder decoder(ScriptedBodyReader::of({frame}, true));
    REQUIRE(decoder.next(&event));
    REQUIRE(event.getPayload() == "first");
    REQUIRE_THROWS_AS(decoder.next(&event), ConnectionError);
  }
}
