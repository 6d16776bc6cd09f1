#pragma once

/// @file json_utils.hpp
/// @brief Minimal JSON helpers for token segments and response bodies.
///
/// Only flat objects are supported: every value must be a string, number,
/// boolean or null. Anything else (nested objects, arrays, trailing data,
/// duplicate keys) is rejected so that a token segment is either fully
/// understood or refused.

#include <cstdint>
#include <cstdio>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tmauth::service::detail {

using JsonValue = std::variant<std::nullptr_t, bool, int64_t, double, std::string>;
using JsonObject = std::map<std::string, JsonValue, std::less<>>;

/// Quote and escape a string for JSON output.
inline std::string jsonQuote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

namespace json_internal {

class Reader {
public:
    explicit Reader(std::string_view text) : text_(text) {}

    std::optional<JsonObject> readObject() {
        JsonObject obj;
        skipWs();
        if (!consume('{')) {
            return std::nullopt;
        }
        skipWs();
        if (consume('}')) {
            return finish(std::move(obj));
        }
        while (true) {
            skipWs();
            auto key = readString();
            if (!key) {
                return std::nullopt;
            }
            skipWs();
            if (!consume(':')) {
                return std::nullopt;
            }
            skipWs();
            auto value = readValue();
            if (!value) {
                return std::nullopt;
            }
            if (!obj.emplace(std::move(*key), std::move(*value)).second) {
                return std::nullopt;  // duplicate key
            }
            skipWs();
            if (consume(',')) {
                continue;
            }
            if (consume('}')) {
                return finish(std::move(obj));
            }
            return std::nullopt;
        }
    }

private:
    std::optional<JsonObject> finish(JsonObject obj) {
        skipWs();
        if (pos_ != text_.size()) {
            return std::nullopt;
        }
        return obj;
    }

    void skipWs() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consumeLiteral(std::string_view lit) {
        if (text_.substr(pos_, lit.size()) == lit) {
            pos_ += lit.size();
            return true;
        }
        return false;
    }

    std::optional<JsonValue> readValue() {
        if (pos_ >= text_.size()) {
            return std::nullopt;
        }
        char c = text_[pos_];
        if (c == '"') {
            auto s = readString();
            if (!s) {
                return std::nullopt;
            }
            return JsonValue{std::move(*s)};
        }
        if (consumeLiteral("true")) {
            return JsonValue{true};
        }
        if (consumeLiteral("false")) {
            return JsonValue{false};
        }
        if (consumeLiteral("null")) {
            return JsonValue{nullptr};
        }
        if (c == '-' || (c >= '0' && c <= '9')) {
            return readNumber();
        }
        return std::nullopt;
    }

    std::optional<JsonValue> readNumber() {
        auto start = pos_;
        bool integral = true;
        consume('-');
        if (pos_ >= text_.size() || text_[pos_] < '0' || text_[pos_] > '9') {
            return std::nullopt;
        }
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
            ++pos_;
        }
        if (consume('.')) {
            integral = false;
            if (!digits()) {
                return std::nullopt;
            }
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            integral = false;
            ++pos_;
            if (!consume('+')) {
                consume('-');
            }
            if (!digits()) {
                return std::nullopt;
            }
        }
        std::string token(text_.substr(start, pos_ - start));
        try {
            if (integral) {
                return JsonValue{static_cast<int64_t>(std::stoll(token))};
            }
            return JsonValue{std::stod(token)};
        } catch (const std::exception&) {
            return std::nullopt;  // out of range
        }
    }

    bool digits() {
        auto start = pos_;
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
            ++pos_;
        }
        return pos_ > start;
    }

    std::optional<std::string> readString() {
        if (!consume('"')) {
            return std::nullopt;
        }
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) {
                return std::nullopt;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u':
                    if (!readUnicodeEscape(out)) {
                        return std::nullopt;
                    }
                    break;
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<uint32_t> readHex4() {
        if (pos_ + 4 > text_.size()) {
            return std::nullopt;
        }
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            v <<= 4;
            if (h >= '0' && h <= '9') {
                v |= static_cast<uint32_t>(h - '0');
            } else if (h >= 'a' && h <= 'f') {
                v |= static_cast<uint32_t>(h - 'a' + 10);
            } else if (h >= 'A' && h <= 'F') {
                v |= static_cast<uint32_t>(h - 'A' + 10);
            } else {
                return std::nullopt;
            }
        }
        return v;
    }

    bool readUnicodeEscape(std::string& out) {
        auto cp = readHex4();
        if (!cp) {
            return false;
        }
        uint32_t code = *cp;
        if (code >= 0xD800 && code <= 0xDBFF) {
            if (!consumeLiteral("\\u")) {
                return false;
            }
            auto low = readHex4();
            if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                return false;
            }
            code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
        } else if (code >= 0xDC00 && code <= 0xDFFF) {
            return false;
        }

        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (code >> 18)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
        return true;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace json_internal

/// Parse a flat JSON object. Returns nullopt on any deviation.
[[nodiscard]] inline std::optional<JsonObject> parseFlatJsonObject(std::string_view text) {
    return json_internal::Reader(text).readObject();
}

/// Look up a value of exactly type T.
template <typename T>
[[nodiscard]] const T* jsonField(const JsonObject& obj, std::string_view key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return std::get_if<T>(&it->second);
}

}  // namespace tmauth::service::detail
