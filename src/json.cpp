#include "hubxfer/json.hpp"
#include <cctype>
#include <cmath>
#include <charconv>
#include <format>

namespace hubxfer::json {

namespace {

class Parser {
public:
    explicit Parser(std::string_view input) : in_(input) {}

    Value parse_document() {
        skip_ws();
        Value v = parse_value(0);
        skip_ws();
        if (pos_ != in_.size()) fail("trailing characters");
        return v;
    }

private:
    static constexpr int kMaxDepth = 256;

    std::string_view in_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& what) const { throw ParseError(what, pos_); }

    void skip_ws() {
        while (pos_ < in_.size() && (in_[pos_] == ' ' || in_[pos_] == '\t' || in_[pos_] == '\n' || in_[pos_] == '\r')) pos_++;
    }

    char peek() const {
        if (pos_ >= in_.size()) fail("unexpected end of input");
        return in_[pos_];
    }

    void expect(char c) {
        if (peek() != c) fail(std::format("expected '{}'", c));
        pos_++;
    }

    void expect_literal(std::string_view lit) {
        if (in_.substr(pos_, lit.size()) != lit) fail(std::format("expected '{}'", lit));
        pos_ += lit.size();
    }

    Value parse_value(int depth) {
        if (depth > kMaxDepth) fail("nesting too deep");
        switch (peek()) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': return Value(parse_string());
            case 't': expect_literal("true"); return Value(true);
            case 'f': expect_literal("false"); return Value(false);
            case 'n': expect_literal("null"); return Value();
            default: return parse_number();
        }
    }

    Value parse_object(int depth) {
        expect('{');
        Object obj;
        skip_ws();
        if (peek() == '}') { pos_++; return Value(std::move(obj)); }
        while (true) {
            skip_ws();
            std::string key = parse_string();
            skip_ws();
            expect(':');
            skip_ws();
            obj.emplace_back(std::move(key), parse_value(depth + 1));
            skip_ws();
            if (peek() == ',') { pos_++; continue; }
            expect('}');
            break;
        }
        return Value(std::move(obj));
    }

    Value parse_array(int depth) {
        expect('[');
        Array arr;
        skip_ws();
        if (peek() == ']') { pos_++; return Value(std::move(arr)); }
        while (true) {
            skip_ws();
            arr.push_back(parse_value(depth + 1));
            skip_ws();
            if (peek() == ',') { pos_++; continue; }
            expect(']');
            break;
        }
        return Value(std::move(arr));
    }

    Value parse_number() {
        size_t start = pos_;
        if (pos_ < in_.size() && in_[pos_] == '-') pos_++;
        if (pos_ >= in_.size() || !std::isdigit(static_cast<unsigned char>(in_[pos_]))) fail("invalid value");
        if (in_[pos_] == '0' && pos_ + 1 < in_.size() && std::isdigit(static_cast<unsigned char>(in_[pos_ + 1]))) {
            fail("leading zero");
        }
        while (pos_ < in_.size() && (std::isdigit(static_cast<unsigned char>(in_[pos_])) ||
               in_[pos_] == '.' || in_[pos_] == 'e' || in_[pos_] == 'E' || in_[pos_] == '+' || in_[pos_] == '-')) {
            pos_++;
        }
        double d = 0;
        auto [ptr, ec] = std::from_chars(in_.data() + start, in_.data() + pos_, d);
        if (ec != std::errc() || ptr != in_.data() + pos_) {
            pos_ = start;
            fail("invalid number");
        }
        return Value(d);
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > in_.size()) fail("truncated \\u escape");
        unsigned cp = 0;
        auto [ptr, ec] = std::from_chars(in_.data() + pos_, in_.data() + pos_ + 4, cp, 16);
        if (ec != std::errc() || ptr != in_.data() + pos_ + 4) fail("invalid \\u escape");
        pos_ += 4;
        return cp;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        while (true) {
            char c = peek();
            pos_++;
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') { out += c; continue; }

            char e = peek();
            pos_++;
            switch (e) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    unsigned cp = parse_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (in_.substr(pos_, 2) != "\\u") fail("unpaired surrogate");
                        pos_ += 2;
                        unsigned lo = parse_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail("invalid escape");
            }
        }
        return out;
    }
};

void newline(std::string& out, int indent, int depth) {
    if (indent < 0) return;
    out += '\n';
    out.append(static_cast<size_t>(indent * depth), ' ');
}

} // namespace

const Value& Value::operator[](std::string_view key) const {
    static const Value null_value;
    if (!is_object()) return null_value;
    for (const auto& [k, v] : as_object()) {
        if (k == key) return v;
    }
    return null_value;
}

bool Value::contains(std::string_view key) const {
    if (!is_object()) return false;
    for (const auto& entry : as_object()) {
        if (entry.first == key) return true;
    }
    return false;
}

Value& Value::set(std::string key, Value value) {
    if (!is_object()) data_ = Object{};
    auto& obj = as_object();
    for (auto& [k, v] : obj) {
        if (k == key) {
            v = std::move(value);
            return v;
        }
    }
    obj.emplace_back(std::move(key), std::move(value));
    return obj.back().second;
}

std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
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
                    out += std::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

void Value::dump_to(std::string& out, int indent, int depth) const {
    if (is_null()) {
        out += "null";
    } else if (is_bool()) {
        out += as_bool() ? "true" : "false";
    } else if (is_number()) {
        double d = as_number();
        if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 9.007199254740992e15) {
            out += std::format("{}", static_cast<long long>(d));
        } else if (std::isfinite(d)) {
            out += std::format("{}", d);
        } else {
            out += "null";
        }
    } else if (is_string()) {
        out += '"';
        out += escape(as_string());
        out += '"';
    } else if (is_array()) {
        const auto& arr = as_array();
        if (arr.empty()) { out += "[]"; return; }
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) out += ',';
            newline(out, indent, depth + 1);
            arr[i].dump_to(out, indent, depth + 1);
        }
        newline(out, indent, depth);
        out += ']';
    } else {
        const auto& obj = as_object();
        if (obj.empty()) { out += "{}"; return; }
        out += '{';
        for (size_t i = 0; i < obj.size(); ++i) {
            if (i > 0) out += ',';
            newline(out, indent, depth + 1);
            out += '"';
            out += escape(obj[i].first);
            out += indent < 0 ? "\":" : "\": ";
            obj[i].second.dump_to(out, indent, depth + 1);
        }
        newline(out, indent, depth);
        out += '}';
    }
}

std::string Value::dump(int indent) const {
    std::string out;
    dump_to(out, indent, 0);
    return out;
}

Value parse(std::string_view input) {
    return Parser(input).parse_document();
}

} // namespace hubxfer::json
