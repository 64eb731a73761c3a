#include "termoracle/net/protocol.hpp"

#include <utility>

#include "termoracle/core/encoding.hpp"

namespace termoracle::net {
    namespace {
        using termoracle::core::i64;

        enum class FieldRule : termoracle::core::u8 {
            String = 0,
            Boolean,
            NonNegativeInt,
            PositiveInt,
            Number,
        };

        struct FieldSpec {
            const char* name;
            FieldRule rule;
        };

        constexpr FieldSpec kFrameFields[] = {
            {"hash_algo", FieldRule::String},
            {"frame_hash", FieldRule::String},
            {"patch_hash", FieldRule::String},
            {"mode", FieldRule::String},
            {"hash_key", FieldRule::String},
            {"interaction_hash", FieldRule::String},
            {"selection_active", FieldRule::Boolean},
            {"frame_idx", FieldRule::NonNegativeInt},
            {"ts_ms", FieldRule::NonNegativeInt},
            {"cols", FieldRule::PositiveInt},
            {"rows", FieldRule::PositiveInt},
            {"patch_bytes", FieldRule::NonNegativeInt},
            {"patch_cells", FieldRule::NonNegativeInt},
            {"patch_runs", FieldRule::NonNegativeInt},
            {"present_bytes", FieldRule::NonNegativeInt},
            {"hovered_link_id", FieldRule::NonNegativeInt},
            {"cursor_offset", FieldRule::NonNegativeInt},
            {"cursor_style", FieldRule::NonNegativeInt},
            {"selection_start", FieldRule::NonNegativeInt},
            {"selection_end", FieldRule::NonNegativeInt},
            {"render_ms", FieldRule::Number},
            {"present_ms", FieldRule::Number},
        };

        bool field_ok(FieldRule rule, const Json& v) {
            i64 n = 0;
            double d = 0.0;
            switch (rule) {
                case FieldRule::String:
                    return v.is_string();
                case FieldRule::Boolean:
                    return v.is_boolean();
                case FieldRule::NonNegativeInt:
                    return termoracle::core::json_get_i64(v, &n) && n >= 0;
                case FieldRule::PositiveInt:
                    return termoracle::core::json_get_i64(v, &n) && n > 0;
                case FieldRule::Number:
                    return termoracle::core::json_get_number(v, &d);
            }
            return false;
        }
    } // namespace

    std::string encode_resize_message(termoracle::core::Geometry g) {
        Json msg = Json::object();
        msg["type"] = "resize";
        msg["cols"] = g.cols;
        msg["rows"] = g.rows;
        return termoracle::core::json_dump_compact(msg);
    }

    Json extract_frame_overrides(const Json& frame) {
        Json out = Json::object();
        if (!frame.is_object()) {
            return out;
        }
        for (const FieldSpec& f : kFrameFields) {
            const Json* v = termoracle::core::json_find(frame, f.name);
            if (v && field_ok(f.rule, *v)) {
                out[f.name] = *v;
            }
        }
        return out;
    }

    bool decode_frame_message(std::string_view text, DecodedFrame* out) {
        if (out == nullptr) {
            return false;
        }
        Json doc;
        std::string ignored;
        if (!termoracle::core::json_parse(text, &doc, &ignored) || !doc.is_object()) {
            return false;
        }

        Json frame = doc;
        if (const Json* payload = termoracle::core::json_find(doc, "payload")) {
            if (payload->is_object()) {
                for (auto it = payload->begin(); it != payload->end(); ++it) {
                    frame[it.key()] = it.value();
                }
            }
        }

        const std::string* type = termoracle::core::json_find_string(frame, "type");
        if (!type || *type != "frame") {
            return false;
        }

        termoracle::core::Bytes data;
        if (const std::string* b64 = termoracle::core::json_find_string(frame, "data_b64")) {
            if (!termoracle::core::is_ok(termoracle::core::base64_decode(*b64, termoracle::core::Base64Mode::Strict, &data))) {
                return false;
            }
        } else if (const std::string* bytes_b64 = termoracle::core::json_find_string(frame, "bytes_b64")) {
            if (!termoracle::core::is_ok(termoracle::core::base64_decode(*bytes_b64, termoracle::core::Base64Mode::Strict, &data))) {
                return false;
            }
        } else if (const std::string* raw = termoracle::core::json_find_string(frame, "data")) {
            data.assign(raw->begin(), raw->end());
        } else {
            return false;
        }

        out->data = std::move(data);
        out->overrides = extract_frame_overrides(frame);
        return true;
    }
} // namespace termoracle::net
