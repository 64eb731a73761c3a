#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "termoracle/core/buffer.hpp"
#include "termoracle/session/scenario.hpp"
#include "termoracle/trace/trace_io.hpp"

namespace tss = termoracle::session;
using termoracle::core::StatusCode;

TEST(Scenario, ShippedScenarioLoads) {
    tss::Scenario sc;
    std::string err;
    ASSERT_EQ(tss::load_scenario_file(TERMORACLE_SCENARIO_FILE, &sc, &err).code, StatusCode::Ok) << err;
    EXPECT_EQ(sc.name, "resize_storm");
    EXPECT_EQ(sc.initial.cols, 120u);
    EXPECT_EQ(sc.initial.rows, 40u);
    ASSERT_FALSE(sc.steps.empty());
    EXPECT_EQ(sc.steps.back().type, tss::StepType::Drain);
}

TEST(Scenario, DefaultsApply) {
    tss::Scenario sc;
    std::string err;
    ASSERT_EQ(tss::load_scenario_text(R"({"name":"minimal","steps":[{"type":"wait"},{"type":"send","data":"x"}]})", &sc, &err).code,
              StatusCode::Ok)
        << err;
    EXPECT_EQ(sc.initial.cols, 120u);
    EXPECT_EQ(sc.initial.rows, 40u);
    EXPECT_DOUBLE_EQ(sc.timeout_s, 30.0);
    ASSERT_EQ(sc.steps.size(), 2u);
    EXPECT_DOUBLE_EQ(sc.steps[0].wait_ms, tss::kDefaultWaitMs);
    EXPECT_EQ(sc.steps[1].input_type, "keys");
    EXPECT_DOUBLE_EQ(sc.steps[1].delay_ms, 0.0);
}

TEST(Scenario, AcceptsFractionalDelays) {
    tss::Scenario sc;
    std::string err;
    ASSERT_EQ(tss::load_scenario_text(
                  R"({"name":"n","steps":[{"type":"send","data":"x","delay_ms":12.5},{"type":"wait","ms":0.25}]})", &sc, &err)
                  .code,
              StatusCode::Ok)
        << err;
    ASSERT_EQ(sc.steps.size(), 2u);
    EXPECT_DOUBLE_EQ(sc.steps[0].delay_ms, 12.5);
    EXPECT_DOUBLE_EQ(sc.steps[1].wait_ms, 0.25);
}

TEST(Scenario, RejectsNegativeOrNonNumericDelays) {
    tss::Scenario sc;
    std::string err;
    EXPECT_EQ(tss::load_scenario_text(R"({"name":"n","steps":[{"type":"drain","delay_ms":-1.5}]})", &sc, &err).code,
              StatusCode::Invalid);
    EXPECT_EQ(err, "step 0 delay_ms must be a non-negative number");
    EXPECT_EQ(tss::load_scenario_text(R"({"name":"n","steps":[{"type":"wait","ms":true}]})", &sc, &err).code,
              StatusCode::Invalid);
    EXPECT_EQ(err, "step 0 ms must be a non-negative number");
}

TEST(Scenario, RejectsUnknownStepType) {
    tss::Scenario sc;
    std::string err;
    EXPECT_EQ(tss::load_scenario_text(R"({"name":"s","steps":[{"type":"wait"},{"type":"jump"}]})", &sc, &err).code,
              StatusCode::Invalid);
    EXPECT_EQ(err, "step 1 has unknown type: jump");
}

TEST(Scenario, RejectsResizeWithoutGeometry) {
    tss::Scenario sc;
    std::string err;
    EXPECT_EQ(tss::load_scenario_text(R"({"name":"s","steps":[{"type":"resize","cols":80}]})", &sc, &err).code, StatusCode::Invalid);
    EXPECT_EQ(err, "step 0 resize needs positive integer cols and rows");
    EXPECT_EQ(tss::load_scenario_text(R"({"name":"s","steps":[{"type":"resize","cols":0,"rows":10}]})", &sc, &err).code,
              StatusCode::Invalid);
}

TEST(Scenario, RejectsBadRoot) {
    tss::Scenario sc;
    std::string err;
    EXPECT_EQ(tss::load_scenario_text(R"({"steps":[]})", &sc, &err).code, StatusCode::Invalid);
    EXPECT_EQ(err, "scenario name must be a non-empty string");
    EXPECT_EQ(tss::load_scenario_text(R"({"name":"s","timeout_s":0})", &sc, &err).code, StatusCode::Invalid);
    EXPECT_EQ(err, "timeout_s must be a positive number");
    EXPECT_EQ(tss::load_scenario_text(R"({"name":"s","steps":{}})", &sc, &err).code, StatusCode::Invalid);
    EXPECT_EQ(err, "steps must be an array");
}

TEST(Scenario, StepTypeNames) {
    tss::StepType t{};
    ASSERT_TRUE(tss::step_type_from_name("drain", &t));
    EXPECT_EQ(t, tss::StepType::Drain);
    EXPECT_STREQ(tss::step_type_name(tss::StepType::Resize), "resize");
    EXPECT_FALSE(tss::step_type_from_name("Drain", &t));
}

TEST(Scenario, DecodeStepDataPrefersHexThenBase64) {
    tss::Step step{};
    step.type = tss::StepType::Send;
    step.data_hex = "1b5b41";
    step.data_b64 = "eA==";
    step.data_text = "text";
    termoracle::core::Bytes out;
    ASSERT_EQ(tss::decode_step_data(step, &out).code, StatusCode::Ok);
    EXPECT_EQ(out, (termoracle::core::Bytes{0x1b, 0x5b, 0x41}));

    step.data_hex.reset();
    ASSERT_EQ(tss::decode_step_data(step, &out).code, StatusCode::Ok);
    EXPECT_EQ(out, (termoracle::core::Bytes{'x'}));

    step.data_b64.reset();
    ASSERT_EQ(tss::decode_step_data(step, &out).code, StatusCode::Ok);
    EXPECT_EQ(std::string(out.begin(), out.end()), "text");

    step.data_text.reset();
    ASSERT_EQ(tss::decode_step_data(step, &out).code, StatusCode::Ok);
    EXPECT_TRUE(out.empty());

    step.data_hex = "zz";
    EXPECT_EQ(tss::decode_step_data(step, &out).code, StatusCode::Invalid);
}

TEST(Golden, LoadsChecksumAndFrames) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "termoracle_golden_test.json";
    const std::string text = R"({"checksum_chain":"sha256:abc","frames":3})";
    ASSERT_EQ(termoracle::trace::write_file(path.string(), termoracle::core::as_view(text)).code, StatusCode::Ok);

    tss::GoldenTranscript g;
    std::string err;
    ASSERT_EQ(tss::load_golden_file(path.string(), &g, &err).code, StatusCode::Ok) << err;
    EXPECT_EQ(g.checksum_chain, "sha256:abc");
    EXPECT_EQ(g.frames, 3);
    std::filesystem::remove(path);

    EXPECT_EQ(tss::load_golden_file(path.string(), &g, &err).code, StatusCode::NotFound);
    EXPECT_EQ(err, "cannot read golden file: " + path.string());
}
