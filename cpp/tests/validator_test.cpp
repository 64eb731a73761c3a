#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "termoracle/schema/schema.hpp"
#include "termoracle/schema/validator.hpp"

namespace ts = termoracle::schema;
using termoracle::core::Json;

namespace {
    ts::Schema test_schema() {
        const char* text = R"({
            "schema_version": "e2e-jsonl-v1",
            "common_required": ["schema_version", "type", "timestamp", "run_id", "seed"],
            "common_types": {"seed": "integer", "run_id": "string", "timestamp": "string"},
            "events": {
                "frame": {
                    "required": ["frame_idx", "hash_algo", "frame_hash", "seed"],
                    "types": {"frame_idx": "integer", "render_ms": "number", "seed": ["integer", "string"]}
                },
                "run_end": {"required": ["status"], "types": {"status": "string"}}
            }
        })";
        ts::Schema schema;
        std::string err;
        EXPECT_EQ(ts::load_schema_text(text, &schema, &err).code, termoracle::core::StatusCode::Ok) << err;
        return schema;
    }

    Json frame_event() {
        return Json::parse(R"({"schema_version":"e2e-jsonl-v1","type":"frame","timestamp":"T000001",
            "run_id":"run_123","seed":0,"frame_idx":0,"hash_algo":"sha256","frame_hash":"sha256:00"})");
    }
} // namespace

TEST(Validator, CleanEventHasNoErrors) {
    const ts::Schema schema = test_schema();
    EXPECT_TRUE(ts::validate_event(schema, frame_event()).empty());
}

TEST(Validator, MissingRequiredFieldIsReportedOnce) {
    const ts::Schema schema = test_schema();
    Json ev = frame_event();
    ev.erase("frame_hash");
    ev.erase("seed");
    const auto errors = ts::validate_event(schema, ev);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "missing required field: seed");
    EXPECT_EQ(errors[1], "missing required field: frame_hash");
}

TEST(Validator, WrongTypeNamesExpectedAndActual) {
    const ts::Schema schema = test_schema();
    Json ev = frame_event();
    ev["frame_idx"] = "zero";
    const auto errors = ts::validate_event(schema, ev);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "field frame_idx has wrong type: expected integer, got string");
}

TEST(Validator, EventTypesOverrideCommonTypes) {
    const ts::Schema schema = test_schema();
    Json ev = frame_event();
    ev["seed"] = "abc";
    EXPECT_TRUE(ts::validate_event(schema, ev).empty());

    ev["seed"] = true;
    const auto errors = ts::validate_event(schema, ev);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "field seed has wrong type: expected [integer, string], got boolean");
}

TEST(Validator, UnknownTypeYieldsExactlyOneFailure) {
    const ts::Schema schema = test_schema();
    const auto errors = ts::validate_event(schema, Json::parse(R"({"type":"mystery"})"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "unknown event type: mystery");
}

TEST(Validator, NonStringTypeStopsEarly) {
    const ts::Schema schema = test_schema();
    const auto errors = ts::validate_event(schema, Json::parse(R"({"type":7})"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "type must be a string");
}

TEST(Validator, SchemaVersionMismatch) {
    const ts::Schema schema = test_schema();
    Json ev = frame_event();
    ev["schema_version"] = "e2e-jsonl-v0";
    auto errors = ts::validate_event(schema, ev);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "schema_version mismatch: expected e2e-jsonl-v1, got e2e-jsonl-v0");

    ev["schema_version"] = nullptr;
    EXPECT_TRUE(ts::validate_event(schema, ev).empty());
}

TEST(Validator, NonJsonLineFailsAndScanningContinues) {
    const ts::Schema schema = test_schema();
    const std::vector<std::string> lines = {
        frame_event().dump(),
        "{not json",
        "",
        "   ",
        "[1, 2]",
        R"({"schema_version":"e2e-jsonl-v1","type":"run_end","timestamp":"T1","run_id":"r","seed":0})",
    };
    const auto failures = ts::validate_trace(schema, lines);
    ASSERT_EQ(failures.size(), 3u);
    EXPECT_EQ(failures[0].line, 2u);
    EXPECT_EQ(failures[0].message.rfind("invalid json: ", 0), 0u);
    EXPECT_EQ(failures[1].line, 5u);
    EXPECT_EQ(failures[1].message, "jsonl line must be an object");
    EXPECT_EQ(failures[2].line, 6u);
    EXPECT_EQ(failures[2].message, "missing required field: status");
}

TEST(Validator, BlankLines) {
    EXPECT_TRUE(ts::is_blank(""));
    EXPECT_TRUE(ts::is_blank(" \t\r"));
    EXPECT_FALSE(ts::is_blank(" {} "));
}
