#include <string>

#include <gtest/gtest.h>

#include "termoracle/net/protocol.hpp"

namespace tn = termoracle::net;
using termoracle::core::Json;

static std::string to_string(const termoracle::core::Bytes& b) {
    return std::string(b.begin(), b.end());
}

TEST(NetProtocol, ResizeMessageIsCompact) {
    EXPECT_EQ(tn::encode_resize_message({100, 30}), R"({"type":"resize","cols":100,"rows":30})");
}

TEST(NetProtocol, DecodesBase64FrameWithMetadata) {
    tn::DecodedFrame f;
    ASSERT_TRUE(tn::decode_frame_message(R"({"type":"frame","data_b64":"aGk=","frame_hash":"sha256:ab","cols":90,"rows":20})", &f));
    EXPECT_EQ(to_string(f.data), "hi");
    EXPECT_EQ(f.overrides["frame_hash"], "sha256:ab");
    EXPECT_EQ(f.overrides["cols"], 90);
    EXPECT_EQ(f.overrides.size(), 3u);
}

TEST(NetProtocol, AcceptsBytesB64AndPlainData) {
    tn::DecodedFrame f;
    ASSERT_TRUE(tn::decode_frame_message(R"({"type":"frame","bytes_b64":"eA=="})", &f));
    EXPECT_EQ(to_string(f.data), "x");
    ASSERT_TRUE(tn::decode_frame_message(R"({"type":"frame","data":"plain"})", &f));
    EXPECT_EQ(to_string(f.data), "plain");
}

TEST(NetProtocol, PayloadWrapperTakesPrecedence) {
    tn::DecodedFrame f;
    ASSERT_TRUE(tn::decode_frame_message(R"({"type":"event","payload":{"type":"frame","data":"wrapped","mode":"alt"}})", &f));
    EXPECT_EQ(to_string(f.data), "wrapped");
    EXPECT_EQ(f.overrides["mode"], "alt");
}

TEST(NetProtocol, NonFramesFallBackToRaw) {
    tn::DecodedFrame f;
    EXPECT_FALSE(tn::decode_frame_message("plain terminal text", &f));
    EXPECT_FALSE(tn::decode_frame_message(R"({"type":"status","data":"x"})", &f));
    EXPECT_FALSE(tn::decode_frame_message(R"({"type":"frame"})", &f));
    EXPECT_FALSE(tn::decode_frame_message(R"({"type":"frame","data_b64":"not base64!"})", &f));
    EXPECT_FALSE(tn::decode_frame_message("[1,2,3]", &f));
}

TEST(NetProtocol, MalformedMetadataIsDropped) {
    const Json frame = Json::parse(R"({"type":"frame","cols":0,"rows":-2,"frame_idx":3,"selection_active":"yes",
        "render_ms":1.5,"patch_bytes":12.5,"hash_key":7,"unknown":"x"})");
    const Json overrides = tn::extract_frame_overrides(frame);
    EXPECT_FALSE(overrides.contains("cols"));
    EXPECT_FALSE(overrides.contains("rows"));
    EXPECT_FALSE(overrides.contains("selection_active"));
    EXPECT_FALSE(overrides.contains("patch_bytes"));
    EXPECT_FALSE(overrides.contains("hash_key"));
    EXPECT_FALSE(overrides.contains("unknown"));
    EXPECT_EQ(overrides["frame_idx"], 3);
    EXPECT_EQ(overrides["render_ms"], 1.5);
}
