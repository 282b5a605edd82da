#include "../common/frame_codec.hpp"
#include <gtest/gtest.h>
#include <string>

namespace {

Frame frameWith(std::initializer_list<std::pair<std::string, std::string>> headers, const std::string& body = "") {
    Frame frame;
    for (const auto& header : headers) frame.set(header.first, header.second);
    frame.body = body;
    return frame;
}

std::string encodeOrFail(const Frame& frame) {
    Result<std::string> bytes = FrameCodec::encode(frame);
    EXPECT_TRUE(bytes.success) << bytes.message;
    return bytes.data;
}

} // namespace

TEST(FrameCodecTest, EncodesHeadersBlankLineAndBody) {
    Frame frame = frameWith({{"Version", "1"}, {"Filename", "notes.txt"}}, "hello");
    EXPECT_EQ(encodeOrFail(frame), "Version: 1\nFilename: notes.txt\nSize: 5\n\nhello");
}

TEST(FrameCodecTest, EncodesFrameWithoutBodyAsHeadersOnly) {
    Frame frame = frameWith({{"Resync", "True"}});
    EXPECT_EQ(encodeOrFail(frame), "Resync: True\n\n");
}

TEST(FrameCodecTest, EncodeRewritesStaleSize) {
    Frame frame = frameWith({{"Size", "999"}, {"Other", "x"}}, "abc");
    EXPECT_EQ(encodeOrFail(frame), "Size: 3\nOther: x\n\nabc");
}

TEST(FrameCodecTest, QuotesFieldsWithEdgeWhitespace) {
    EXPECT_EQ(encodeOrFail(frameWith({{"String", "Some data"}})), "String: Some data\n\n");
    EXPECT_EQ(encodeOrFail(frameWith({{" Pre-spaced", " pre-spaced"}})), "\" Pre-spaced\": \" pre-spaced\"\n\n");
    EXPECT_EQ(encodeOrFail(frameWith({{"Post-spaced ", "post-spaced "}})), "\"Post-spaced \": \"post-spaced \"\n\n");
    EXPECT_EQ(encodeOrFail(frameWith({{" Dual-spaced ", " dual-spaced "}})), "\" Dual-spaced \": \" dual-spaced \"\n\n");
}

TEST(FrameCodecTest, QuotesAndEscapesSpecialCharacters) {
    EXPECT_TRUE(FrameCodec::needsQuoting(""));
    EXPECT_TRUE(FrameCodec::needsQuoting("a:b"));
    EXPECT_TRUE(FrameCodec::needsQuoting("say \"hi\""));
    EXPECT_TRUE(FrameCodec::needsQuoting("back\\slash"));
    EXPECT_TRUE(FrameCodec::needsQuoting("two\nlines"));
    EXPECT_TRUE(FrameCodec::needsQuoting("\ttabbed"));
    EXPECT_FALSE(FrameCodec::needsQuoting("plain value with inner spaces"));

    EXPECT_EQ(FrameCodec::encodeField(""), "\"\"");
    EXPECT_EQ(FrameCodec::encodeField("a \"b\" \\ c\nd\re"), "\"a \\\"b\\\" \\\\ c\\nd\\re\"");
}

TEST(FrameCodecTest, RoundTripsAwkwardFieldsAndBinaryBody) {
    std::string body("line one\n\nline three\n", 21);
    body += std::string("\0\x01\xff", 3);
    Frame frame = frameWith({
        {"Version", "1"},
        {"Contents", " My name: Test String! "},
        {"Quote", "He said \"no\""},
        {"Path", "C:\\temp\\file"},
        {"Multi", "first\nsecond\r\nthird"},
        {"Empty", ""},
        {"Tabbed", "\tvalue\t"},
    }, body);

    std::string bytes = encodeOrFail(frame);
    Frame decoded;
    Result<size_t> consumed = FrameCodec::decode(bytes, decoded);
    ASSERT_TRUE(consumed.success) << consumed.message;
    EXPECT_EQ(consumed.data, bytes.size());

    frame.set("Size", std::to_string(body.size()));
    EXPECT_EQ(decoded, frame);
}

TEST(FrameCodecTest, DecodesMixedQuotingAndSpacing) {
    std::string bytes =
        "Version: 1\n"
        "\" Header with spaces \" :        \"   Header contents with spaces  \"\n"
        "Integer: 0\n"
        "Float: -2.7182818284\n"
        "True:True\n"
        "\tFalse : False\n"
        "False-String: \"False\"\n"
        "None:None\n"
        "Size: 21\n"
        "\n"
        "Some data goes here.\n";

    Frame frame;
    Result<size_t> consumed = FrameCodec::decode(bytes, frame);
    ASSERT_TRUE(consumed.success) << consumed.message;
    EXPECT_EQ(consumed.data, bytes.size());

    ASSERT_EQ(frame.headers.size(), 9u);
    EXPECT_EQ(*frame.find("Version"), "1");
    EXPECT_EQ(*frame.find(" Header with spaces "), "   Header contents with spaces  ");
    EXPECT_EQ(*frame.find("Integer"), "0");
    EXPECT_EQ(*frame.find("Float"), "-2.7182818284");
    EXPECT_EQ(*frame.find("True"), "True");
    EXPECT_EQ(*frame.find("False"), "False");
    EXPECT_EQ(*frame.find("False-String"), "False");
    EXPECT_EQ(*frame.find("None"), "None");
    EXPECT_EQ(frame.body, "Some data goes here.\n");
}

TEST(FrameCodecTest, DecodesQuotedValueHoldingColon) {
    Frame frame;
    Result<size_t> consumed = FrameCodec::decode("Contents: \" My name: Test String! \"\n\n", frame);
    ASSERT_TRUE(consumed.success) << consumed.message;
    EXPECT_EQ(*frame.find("Contents"), " My name: Test String! ");
}

TEST(FrameCodecTest, UnquotedValuesAreTrimmed) {
    Frame frame;
    Result<size_t> consumed = FrameCodec::decode("Name:    spaced out   \n\n", frame);
    ASSERT_TRUE(consumed.success) << consumed.message;
    EXPECT_EQ(*frame.find("Name"), "spaced out");
}

TEST(FrameCodecTest, FrameWithoutSizeHasEmptyBody) {
    Frame frame;
    Result<size_t> consumed = FrameCodec::decode("Resync: True\n\ntrailing", frame);
    ASSERT_TRUE(consumed.success) << consumed.message;
    EXPECT_EQ(consumed.data, 14u);
    EXPECT_TRUE(frame.body.empty());
}

TEST(FrameCodecTest, EmptyHeaderBlockIsAFrame) {
    Frame frame;
    Result<size_t> consumed = FrameCodec::decode("\n", frame);
    ASSERT_TRUE(consumed.success) << consumed.message;
    EXPECT_EQ(consumed.data, 1u);
    EXPECT_TRUE(frame.headers.empty());
}

TEST(FrameCodecTest, NeedsMoreDataForPartialFrames) {
    Frame frame;
    Result<size_t> headers = FrameCodec::decode("Version: 1\nOther-Header: Something\nPartial-Heade", frame);
    ASSERT_TRUE(headers.success);
    EXPECT_EQ(headers.data, 0u);

    Result<size_t> body = FrameCodec::decode("Size: 10\n\n12345", frame);
    ASSERT_TRUE(body.success);
    EXPECT_EQ(body.data, 0u);
}

TEST(FrameCodecTest, DecodeStopsAtFrameBoundary) {
    std::string first = encodeOrFail(frameWith({{"Differential", "False"}}, "abc"));
    std::string second = encodeOrFail(frameWith({{"Differential", "True"}}, "defg"));
    std::string stream = first + second;

    Frame frame;
    Result<size_t> consumed = FrameCodec::decode(stream, frame);
    ASSERT_TRUE(consumed.success);
    EXPECT_EQ(consumed.data, first.size());
    EXPECT_EQ(frame.body, "abc");

    consumed = FrameCodec::decode(stream.substr(consumed.data), frame);
    ASSERT_TRUE(consumed.success);
    EXPECT_EQ(consumed.data, second.size());
    EXPECT_EQ(frame.body, "defg");
}

TEST(FrameCodecTest, RejectsMalformedHeaderLines) {
    const char* malformed[] = {
        "NoColonHere\n\n",
        ": value without name\n\n",
        "\"unterminated: value\n\n",
        "Name: \"unterminated value\n\n",
        "Name: \"quoted\" trailing\n\n",
        "\"quoted\" name: value\n\n",
        "Name: \"bad \\q escape\"\n\n",
        "\"two\\nlines\": value\n\n",
    };
    for (const char* bytes : malformed) {
        Frame frame;
        Result<size_t> result = FrameCodec::decode(bytes, frame);
        EXPECT_FALSE(result.success) << bytes;
        EXPECT_EQ(result.code, ErrorCode::Protocol) << bytes;
    }
}

TEST(FrameCodecTest, RejectsDuplicateHeaders) {
    Frame frame;
    Result<size_t> result = FrameCodec::decode("Name: one\nName: two\n\n", frame);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::Protocol);
}

TEST(FrameCodecTest, RejectsInvalidSize) {
    for (const char* bytes : {"Size: abc\n\n", "Size: -5\n\n", "Size: 1.5\n\n", "Size: \"\"\n\n",
                              "Size: 99999999999999999999999\n\n", "Size: 2000000000\n\n"}) {
        Frame frame;
        Result<size_t> result = FrameCodec::decode(bytes, frame);
        EXPECT_FALSE(result.success) << bytes;
        EXPECT_EQ(result.code, ErrorCode::Protocol) << bytes;
    }
}

TEST(FrameCodecTest, RejectsOversizedHeaderBlock) {
    std::string bytes = "Long: " + std::string(70 * 1024, 'x');
    Frame frame;
    Result<size_t> result = FrameCodec::decode(bytes, frame);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::Protocol);
}

TEST(FrameCodecTest, EncodeRejectsNamesThatCannotRoundTrip) {
    for (const char* name : {"Bad:Name", "Bad\nName"}) {
        Result<std::string> result = FrameCodec::encode(frameWith({{name, "value"}}));
        EXPECT_FALSE(result.success) << name;
        EXPECT_EQ(result.code, ErrorCode::Protocol);
    }
}

TEST(FrameCodecTest, ParsesUnsignedStrictly) {
    size_t value = 0;
    EXPECT_TRUE(FrameCodec::parseUnsigned("0", value));
    EXPECT_EQ(value, 0u);
    EXPECT_TRUE(FrameCodec::parseUnsigned("4096", value));
    EXPECT_EQ(value, 4096u);
    EXPECT_FALSE(FrameCodec::parseUnsigned("", value));
    EXPECT_FALSE(FrameCodec::parseUnsigned("+1", value));
    EXPECT_FALSE(FrameCodec::parseUnsigned("12a", value));
}
