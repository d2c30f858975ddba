/**
 * @file test_message_classifier.cpp
 * @brief Unit tests for status message classification and the download request
 */

#include <gtest/gtest.h>

#include <kcenon/xdcc_client/protocol/message_classifier.h>

#include <nlohmann/json.hpp>

#include <string>

namespace kcenon::xdcc_client::test {

class MessageClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    template <typename T>
    auto classify_as(std::string_view payload) -> T {
        auto result = classify(payload);
        EXPECT_TRUE(result.has_value()) << result.error().message;
        EXPECT_TRUE(std::holds_alternative<T>(result.value()))
            << "classified as " << to_string(kind_of(result.value()));
        return std::get<T>(result.value());
    }
};

// =============================================================================
// Known statuses
// =============================================================================

TEST_F(MessageClassifierTest, DownloadingIsAccepted) {
    auto message = classify_as<accepted_message>(
        R"({"status":"downloading","message":"Download started","pack_number":"42"})");

    EXPECT_EQ(message.info, "Download started");
    EXPECT_EQ(message.pack_number, "42");
}

TEST_F(MessageClassifierTest, ProgressFields) {
    auto message = classify_as<progress_message>(
        R"({"status":"progress","progress":37,"filename":"show.mkv","received":370,"total":1000})");

    EXPECT_EQ(message.percent, 37);
    EXPECT_EQ(message.filename, "show.mkv");
    EXPECT_EQ(message.bytes_received, 370u);
    EXPECT_EQ(message.bytes_total, 1000u);
}

TEST_F(MessageClassifierTest, SuccessFields) {
    auto message = classify_as<success_message>(
        R"({"status":"success","filename":"show.mkv","size":1000,"path":"/srv/show.mkv","pack_number":"42"})");

    EXPECT_EQ(message.filename, "show.mkv");
    EXPECT_EQ(message.size_bytes, 1000u);
    EXPECT_EQ(message.saved_path, "/srv/show.mkv");
    EXPECT_EQ(message.pack_number, "42");
}

TEST_F(MessageClassifierTest, ErrorIsFailure) {
    auto message = classify_as<failure_message>(
        R"({"status":"error","message":"Bot not found","pack_number":"42"})");

    EXPECT_EQ(message.reason, "Bot not found");
    EXPECT_EQ(message.pack_number, "42");
}

TEST_F(MessageClassifierTest, KindOfMatchesAlternative) {
    auto result = classify(R"({"status":"error"})");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(kind_of(result.value()), status_kind::failure);
    EXPECT_STREQ(to_string(status_kind::failure), "failure");
}

TEST_F(MessageClassifierTest, ClassifyFrameUsesPayload) {
    frame f;
    f.payload = R"({"status":"downloading","message":"ok"})";
    f.stream_offset = 12;

    auto result = classify(f);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<accepted_message>(result.value()));
}

// =============================================================================
// Defaults
// =============================================================================

TEST_F(MessageClassifierTest, MissingFieldsTakeDefaults) {
    auto accepted = classify_as<accepted_message>(R"({"status":"downloading"})");
    EXPECT_EQ(accepted.info, "unknown");
    EXPECT_EQ(accepted.pack_number, "unknown");

    auto progress = classify_as<progress_message>(R"({"status":"progress"})");
    EXPECT_EQ(progress.percent, 0);
    EXPECT_EQ(progress.filename, "unknown");
    EXPECT_EQ(progress.bytes_received, 0u);
    EXPECT_EQ(progress.bytes_total, 0u);

    auto success = classify_as<success_message>(R"({"status":"success"})");
    EXPECT_EQ(success.filename, "unknown");
    EXPECT_EQ(success.size_bytes, 0u);
    EXPECT_EQ(success.saved_path, "unknown");

    auto failure = classify_as<failure_message>(R"({"status":"error"})");
    EXPECT_EQ(failure.reason, "unknown");
}

TEST_F(MessageClassifierTest, NonStringTextFieldTakesDefault) {
    auto message = classify_as<failure_message>(R"({"status":"error","message":{"code":5}})");
    EXPECT_EQ(message.reason, "unknown");

    auto progress = classify_as<progress_message>(R"({"status":"progress","filename":null})");
    EXPECT_EQ(progress.filename, "unknown");
}

// =============================================================================
// Coercion
// =============================================================================

TEST_F(MessageClassifierTest, FractionalPercentIsTruncated) {
    auto message = classify_as<progress_message>(R"({"status":"progress","progress":99.9})");
    EXPECT_EQ(message.percent, 99);
}

TEST_F(MessageClassifierTest, PercentIsClamped) {
    EXPECT_EQ(classify_as<progress_message>(R"({"status":"progress","progress":150})").percent, 100);
    EXPECT_EQ(classify_as<progress_message>(R"({"status":"progress","progress":-5})").percent, 0);
}

TEST_F(MessageClassifierTest, NonNumericPercentIsZero) {
    EXPECT_EQ(classify_as<progress_message>(R"({"status":"progress","progress":"50"})").percent, 0);
    EXPECT_EQ(classify_as<progress_message>(R"({"status":"progress","progress":true})").percent, 0);
}

TEST_F(MessageClassifierTest, ByteCounts) {
    auto message = classify_as<progress_message>(
        R"({"status":"progress","received":1048576.75,"total":-10})");
    EXPECT_EQ(message.bytes_received, 1048576u);
    EXPECT_EQ(message.bytes_total, 0u);

    auto large = classify_as<success_message>(R"({"status":"success","size":8589934592})");
    EXPECT_EQ(large.size_bytes, 8589934592ull);

    auto text = classify_as<success_message>(R"({"status":"success","size":"1000"})");
    EXPECT_EQ(text.size_bytes, 0u);
}

TEST_F(MessageClassifierTest, NumericPackNumberIsRenderedAsText) {
    auto message = classify_as<accepted_message>(R"({"status":"downloading","pack_number":42})");
    EXPECT_EQ(message.pack_number, "42");

    auto failure = classify_as<failure_message>(R"({"status":"error","pack_number":-3})");
    EXPECT_EQ(failure.pack_number, "-3");

    auto other = classify_as<failure_message>(R"({"status":"error","pack_number":[1]})");
    EXPECT_EQ(other.pack_number, "unknown");
}

// =============================================================================
// Unrecognized and malformed
// =============================================================================

TEST_F(MessageClassifierTest, UnknownStatusIsUnrecognized) {
    auto message = classify_as<unrecognized_message>(R"({"status":"heartbeat","seq":3})");

    EXPECT_EQ(message.raw_fields["status"], "heartbeat");
    EXPECT_EQ(message.raw_fields["seq"], 3);
}

TEST_F(MessageClassifierTest, MissingStatusIsUnrecognized) {
    auto message = classify_as<unrecognized_message>(R"({"progress":50})");
    EXPECT_EQ(message.raw_fields["progress"], 50);
}

TEST_F(MessageClassifierTest, NonStringStatusIsUnrecognized) {
    (void)classify_as<unrecognized_message>(R"({"status":1})");
}

TEST_F(MessageClassifierTest, StatusIsCaseSensitive) {
    (void)classify_as<unrecognized_message>(R"({"status":"SUCCESS"})");
}

TEST_F(MessageClassifierTest, InvalidJsonIsMalformed) {
    auto result = classify(R"({"status":"progress",)");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::malformed_frame);
}

TEST_F(MessageClassifierTest, NonObjectIsMalformed) {
    auto array = classify("[1,2,3]");
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error().code, error_code::malformed_frame);

    auto text = classify(R"("success")");
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code, error_code::malformed_frame);
}

// =============================================================================
// Download request
// =============================================================================

class DownloadRequestTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(DownloadRequestTest, SerializesAllFields) {
    download_request request{"CR-HOLLAND|NEW", "42", true};
    auto parsed = nlohmann::json::parse(request.to_json());

    EXPECT_EQ(parsed["bot_name"], "CR-HOLLAND|NEW");
    EXPECT_EQ(parsed["pack_number"], "42");
    EXPECT_EQ(parsed["send_progress"], true);
    EXPECT_EQ(parsed.size(), 3u);
}

TEST_F(DownloadRequestTest, ProgressCanBeDisabled) {
    download_request request{"Bot", "1", false};
    auto parsed = nlohmann::json::parse(request.to_json());

    EXPECT_EQ(parsed["send_progress"], false);
}

TEST_F(DownloadRequestTest, CompactWithoutNewline) {
    download_request request{"Bot", "7"};
    auto text = request.to_json();

    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_EQ(text.front(), '{');
    EXPECT_EQ(text.back(), '}');
}

TEST_F(DownloadRequestTest, SpecialCharactersAreEscaped) {
    download_request request{"Bot \"quoted\"", "{7}"};
    auto parsed = nlohmann::json::parse(request.to_json());

    EXPECT_EQ(parsed["bot_name"], "Bot \"quoted\"");
    EXPECT_EQ(parsed["pack_number"], "{7}");
}

}  // namespace kcenon::xdcc_client::test
