#include <colorkit/worker/contrast_region_protocol.h>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace colorkit;
using namespace colorkit::worker;

// ------------------------------------------------------------------
// 1. Requests
// ------------------------------------------------------------------

TEST(ContrastRegionProtocolTest, RequestSurvivesEncoding) {
    ContrastRegionRequest request;
    request.id = 17;
    request.reference = Color{0.9, 0.03, 95, 1};
    request.hue = 24.864352050672835;
    request.axes.x = {AreaChannel::C, {0, 0.37}};
    request.axes.y = {AreaChannel::L, {0, 1}};
    request.options.level = ContrastLevel::AAA;
    request.options.threshold = 4.8;
    request.options.gamut = GamutTarget::DisplayP3;
    request.options.lightness_steps = 12;
    request.options.chroma_steps = 9;
    request.options.max_chroma = 0.3;
    request.options.edge_interpolation = EdgeInterpolation::Midpoint;

    ipc::Message msg = encode_request(request);
    EXPECT_EQ(msg.type, kContrastRegionRequest);
    EXPECT_EQ(msg.request_id, 17u);

    ContrastRegionRequest decoded = decode_request(msg);
    EXPECT_EQ(decoded.id, 17u);
    EXPECT_EQ(decoded.reference, request.reference);
    EXPECT_EQ(decoded.hue, request.hue);
    EXPECT_EQ(decoded.axes.x.channel, AreaChannel::C);
    EXPECT_EQ(decoded.axes.x.range.max, 0.37);
    EXPECT_EQ(decoded.axes.y.channel, AreaChannel::L);
    EXPECT_EQ(decoded.options.level, ContrastLevel::AAA);
    ASSERT_TRUE(decoded.options.threshold.has_value());
    EXPECT_EQ(*decoded.options.threshold, 4.8);
    EXPECT_EQ(decoded.options.gamut, GamutTarget::DisplayP3);
    EXPECT_EQ(decoded.options.lightness_steps, 12);
    EXPECT_EQ(decoded.options.chroma_steps, 9);
    EXPECT_EQ(decoded.options.max_chroma, 0.3);
    EXPECT_EQ(decoded.options.edge_interpolation, EdgeInterpolation::Midpoint);
}

TEST(ContrastRegionProtocolTest, AbsentThresholdStaysAbsent) {
    ContrastRegionRequest request;
    ContrastRegionRequest decoded = decode_request(encode_request(request));
    EXPECT_FALSE(decoded.options.threshold.has_value());
}

TEST(ContrastRegionProtocolTest, RejectsUnknownEnumTag) {
    ipc::Message msg = encode_request(ContrastRegionRequest{});
    // reference (4 x f64) + hue (f64), then the x axis channel tag
    msg.payload[40] = 9;
    try {
        decode_request(msg);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Invalid area channel tag: 9");
    }
}

TEST(ContrastRegionProtocolTest, RejectsShortPayload) {
    ipc::Message msg = encode_request(ContrastRegionRequest{});
    msg.payload.resize(10);
    EXPECT_THROW(decode_request(msg), std::runtime_error);
}

TEST(ContrastRegionProtocolTest, RejectsWrongMessageType) {
    ipc::Message msg = encode_response(ContrastRegionResponse{});
    try {
        decode_request(msg);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Unexpected message type 2, expected 1");
    }
}

// ------------------------------------------------------------------
// 2. Responses
// ------------------------------------------------------------------

TEST(ContrastRegionProtocolTest, ResponseCarriesPaths) {
    ContrastRegionResponse response;
    response.id = 4;
    response.paths.push_back(AreaPath{AreaPoint{0, 0.5}, AreaPoint{0.25, 0.5}});
    response.paths.push_back(AreaPath{AreaPoint{1, 1}, AreaPoint{0.5, 0.75}, AreaPoint{1, 1}});
    response.compute_time_ms = 1.5;

    ContrastRegionResponse decoded = decode_response(encode_response(response));
    EXPECT_EQ(decoded.id, 4u);
    EXPECT_EQ(decoded.paths, response.paths);
    EXPECT_FALSE(decoded.error.has_value());
    EXPECT_EQ(decoded.compute_time_ms, 1.5);
}

TEST(ContrastRegionProtocolTest, ResponseCarriesError) {
    ContrastRegionResponse response;
    response.id = 5;
    response.error = "contrast_region_paths() requires threshold > 1";

    ContrastRegionResponse decoded = decode_response(encode_response(response));
    EXPECT_TRUE(decoded.paths.empty());
    ASSERT_TRUE(decoded.error.has_value());
    EXPECT_EQ(*decoded.error, *response.error);
}
