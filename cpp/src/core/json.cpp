#include "termoracle/core/json.hpp"

#include <limits>

namespace termoracle::core {
    namespace {
        std::string strip_exception_prefix(const char* what) {
            std::string_view msg(what);
            if (!msg.empty() && msg.front() == '[') {
                const size_t close = msg.find("] ");
                if (close != std::string_view::npos) {
                    msg.remove_prefix(close + 2);
                }
            }
            return std::string(msg);
        }
    } // namespace

    bool json_parse(std::string_view text, Json* out, std::string* error) {
        if (out == nullptr) {
            return false;
        }
        try {
            *out = Json::parse(text.begin(), text.end());
        } catch (const Json::exception& e) {
            if (error != nullptr) {
                *error = strip_exception_prefix(e.what());
            }
            return false;
        }
        return true;
    }

    std::string json_dump_compact(const Json& v) {
        return v.dump(-1, ' ', false, Json::error_handler_t::replace);
    }

    std::string json_dump_pretty(const Json& v) {
        return v.dump(2, ' ', false, Json::error_handler_t::replace);
    }

    const char* json_kind_name(const Json& v) noexcept {
        switch (v.type()) {
        case Json::value_t::string: return "string";
        case Json::value_t::boolean: return "boolean";
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned: return "integer";
        case Json::value_t::number_float: return "number";
        case Json::value_t::null: return "null";
        case Json::value_t::object: return "object";
        case Json::value_t::array: return "array";
        default: return "unknown";
        }
    }

    bool json_get_i64(const Json& v, i64* out) noexcept {
        if (out == nullptr) {
            return false;
        }
        if (v.is_number_unsigned()) {
            const u64 u = v.get<u64>();
            if (u > static_cast<u64>(std::numeric_limits<i64>::max())) {
                return false;
            }
            *out = static_cast<i64>(u);
            return true;
        }
        if (v.is_number_integer()) {
            *out = v.get<i64>();
            return true;
        }
        return false;
    }

    bool json_get_number(const Json& v, double* out) noexcept {
        if (out == nullptr || v.is_boolean() || !v.is_number()) {
            return false;
        }
        *out = v.get<double>();
        return true;
    }

    const std::string* json_find_string(const Json& obj, const char* key) noexcept {
        const Json* v = json_find(obj, key);
        if (v == nullptr || !v->is_string()) {
            return nullptr;
        }
        return v->get_ptr<const std::string*>();
    }

    const Json* json_find(const Json& obj, const char* key) noexcept {
        if (!obj.is_object()) {
            return nullptr;
        }
        const auto it = obj.find(key);
        if (it == obj.end()) {
            return nullptr;
        }
        return &*it;
    }
} // namespace termoracle::core
