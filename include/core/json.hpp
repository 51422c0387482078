#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/utils.hpp"

namespace llmshield {

/**
 * @brief Thin wrapper around glz::json_t for metadata and audit detail payloads
 *
 * Parsing goes through glaze; dump() writes compact JSON with keys in
 * map order so stored payloads are stable across runs.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    JsonValue(int v) { data_ = static_cast<double>(v); }
    JsonValue(unsigned v) { data_ = static_cast<double>(v); }
    JsonValue(long v) { data_ = static_cast<double>(v); }
    JsonValue(unsigned long v) { data_ = static_cast<double>(v); }
    JsonValue(long long v) { data_ = static_cast<double>(v); }
    JsonValue(double v) { data_ = v; }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(std::string_view v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }
    JsonValue(std::string&& v) { data_ = std::move(v); }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool is_number_integer() const {
        if (!data_.is_number()) return false;
        const double d = data_.get<double>();
        return std::isfinite(d) && d == std::floor(d);
    }

    [[nodiscard]] bool empty() const { return data_.empty(); }
    [[nodiscard]] size_t size() const { return data_.size(); }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    [[nodiscard]] std::vector<std::pair<std::string, JsonValue>> items() const {
        std::vector<std::pair<std::string, JsonValue>> out;
        if (!data_.is_object()) return out;
        for (const auto& [k, v] : data_.get_object()) {
            out.emplace_back(k, JsonValue(v));
        }
        return out;
    }

    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> out;
        if (!data_.is_array()) return out;
        for (const auto& v : data_.get_array()) {
            out.emplace_back(v);
        }
        return out;
    }

    // ===== Mutation =====

    JsonValue& set(std::string_view key, JsonValue val) {
        if (!data_.is_object()) data_ = object_t{};
        data_.get_object()[std::string(key)] = std::move(val.data_);
        return *this;
    }

    JsonValue& push_back(JsonValue val) {
        if (!data_.is_array()) data_ = array_t{};
        data_.get_array().push_back(std::move(val.data_));
        return *this;
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue object() {
        glz::json_t j;
        j = object_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue array() {
        glz::json_t j;
        j = array_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        const std::string buffer(json_str);
        auto ec = glz::read_json(result, buffer);
        if (ec) {
            throw parse_error(std::format("JSON parse error in {}-byte document", buffer.size()));
        }
        return JsonValue(std::move(result));
    }

    // ===== Serialization =====

    [[nodiscard]] std::string dump() const {
        std::string out;
        dump_to(data_, out);
        return out;
    }

private:
    static void dump_to(const glz::json_t& node, std::string& out) {
        if (node.is_null()) {
            out += "null";
        } else if (node.is_boolean()) {
            out += node.get<bool>() ? "true" : "false";
        } else if (node.is_number()) {
            const double d = node.get<double>();
            if (!std::isfinite(d)) {
                out += "null";
            } else if (d == std::floor(d) && std::fabs(d) < 9.0e15) {
                out += std::format("{}", static_cast<int64_t>(d));
            } else {
                out += std::format("{}", d);
            }
        } else if (node.is_string()) {
            out += '"';
            out += utils::escape_json(node.get<std::string>());
            out += '"';
        } else if (node.is_array()) {
            out += '[';
            bool first = true;
            for (const auto& item : node.get_array()) {
                if (!first) out += ',';
                first = false;
                dump_to(item, out);
            }
            out += ']';
        } else if (node.is_object()) {
            out += '{';
            bool first = true;
            for (const auto& [key, item] : node.get_object()) {
                if (!first) out += ',';
                first = false;
                out += '"';
                out += utils::escape_json(key);
                out += "\":";
                dump_to(item, out);
            }
            out += '}';
        }
    }

    glz::json_t data_{};
};

} // namespace llmshield
