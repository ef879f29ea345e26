// serialization.cpp - JSON rendering and parsing of Values

#include <diffit/serialization.h>
#include <diffit/errors.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace diffit {

namespace {

std::string json_escape_string(const std::string& s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control characters as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

class JsonWriter {
public:
    explicit JsonWriter(bool compact) : compact_(compact) {}

    std::string str() const { return oss_.str(); }

    void write(const Value& val, int indent_level)
    {
        std::visit([&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                oss_ << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                oss_ << (arg ? "true" : "false");
            } else if constexpr (std::is_same_v<T, int32_t> ||
                                 std::is_same_v<T, int64_t> ||
                                 std::is_same_v<T, uint32_t> ||
                                 std::is_same_v<T, uint64_t>) {
                oss_ << arg;
            } else if constexpr (std::is_same_v<T, double>) {
                oss_ << format_number(arg);
            } else if constexpr (std::is_same_v<T, std::string>) {
                oss_ << json_quote(arg);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                oss_ << json_quote(format_timestamp(arg));
            } else if constexpr (std::is_same_v<T, Duration>) {
                oss_ << arg.count();
            } else if constexpr (std::is_same_v<T, ValueRecord>) {
                write_record(arg, indent_level);
            } else if constexpr (std::is_same_v<T, ValueMap>) {
                write_map(arg, indent_level);
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                write_vector(arg, indent_level);
            } else if constexpr (std::is_same_v<T, ValueRef>) {
                if (arg.is_null()) {
                    oss_ << "null";
                    return;
                }
                if (std::find(branch_.begin(), branch_.end(), arg.identity()) != branch_.end()) {
                    throw CyclicStructureError("");
                }
                branch_.push_back(arg.identity());
                write(*arg.target, indent_level);
                branch_.pop_back();
            } else if constexpr (std::is_same_v<T, ValueDynamic>) {
                write(*arg.value, indent_level);
            } else if constexpr (std::is_same_v<T, ValueCallable>) {
                oss_ << "null";
            }
        }, val.data);
    }

private:
    std::string indent(int level) const { return compact_ ? "" : std::string(level * 2, ' '); }
    const char* newline() const { return compact_ ? "" : "\n"; }
    const char* colon() const { return compact_ ? ":" : ": "; }

    template <typename Entries>
    void write_object(const Entries& entries, int indent_level)
    {
        if (entries.empty()) {
            oss_ << "{}";
            return;
        }
        oss_ << "{" << newline();
        bool first = true;
        for (const auto& [key, value] : entries) {
            if (!first) oss_ << "," << newline();
            first = false;
            oss_ << indent(indent_level + 1) << json_quote(key) << colon();
            write(*value, indent_level + 1);
        }
        oss_ << newline() << indent(indent_level) << "}";
    }

    void write_record(const ValueRecord& record, int indent_level)
    {
        std::vector<std::pair<std::string, const Value*>> entries;
        for (std::size_t i = 0; i < record.fields.size(); ++i) {
            if (record.type) {
                const auto& desc = record.type->field(i);
                if (!desc.omitted) {
                    entries.emplace_back(desc.external_name, &record.fields[i].get());
                }
            } else {
                entries.emplace_back(std::to_string(i), &record.fields[i].get());
            }
        }
        write_object(entries, indent_level);
    }

    void write_map(const ValueMap& map, int indent_level)
    {
        std::vector<std::pair<std::string, const Value*>> entries;
        entries.reserve(map.size());
        for (const auto& [key, box] : map) {
            entries.emplace_back(key, &box.get());
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
        write_object(entries, indent_level);
    }

    void write_vector(const ValueVector& vec, int indent_level)
    {
        if (vec.size() == 0) {
            oss_ << "[]";
            return;
        }
        oss_ << "[" << newline();
        for (std::size_t i = 0; i < vec.size(); ++i) {
            if (i > 0) oss_ << "," << newline();
            oss_ << indent(indent_level + 1);
            write(*vec[i], indent_level + 1);
        }
        oss_ << newline() << indent(indent_level) << "]";
    }

    bool compact_;
    std::ostringstream oss_;
    std::vector<const void*> branch_;
};

// ============================================================
// JSON reader
// ============================================================

/// Recursive-descent reader over a string_view. Every failure is a
/// std::runtime_error naming the byte offset.
class JsonReader {
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    Value read_document() {
        Value result = read_value();
        skip_space();
        if (pos_ != text_.size()) {
            fail("trailing characters");
        }
        return result;
    }

private:
    [[noreturn]] void fail(std::string_view what) const {
        throw std::runtime_error(std::string{what} + " at offset " + std::to_string(pos_));
    }

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool at_end() const { return pos_ >= text_.size(); }

    /// Consume `c` after optional whitespace, or fail
    void require(char c) {
        skip_space();
        if (at_end() || text_[pos_] != c) {
            fail(std::string{"expected '"} + c + "'");
        }
        ++pos_;
    }

    /// Consume `c` after optional whitespace if it is next
    bool accept(char c) {
        skip_space();
        if (!at_end() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    Value read_value() {
        skip_space();
        if (at_end()) {
            fail("unexpected end of input");
        }
        switch (text_[pos_]) {
            case '{': return read_object();
            case '[': return read_array();
            case '"': return Value{read_string()};
            case 't': return read_literal("true", Value{true});
            case 'f': return read_literal("false", Value{false});
            case 'n': return read_literal("null", Value{});
            default:  return read_number();
        }
    }

    Value read_literal(std::string_view word, Value result) {
        if (text_.substr(pos_, word.size()) != word) {
            fail("invalid literal");
        }
        pos_ += word.size();
        return result;
    }

    Value read_object() {
        require('{');
        auto map = ValueMap{}.transient();
        if (accept('}')) {
            return Value{map.persistent()};
        }
        do {
            skip_space();
            auto key = read_string();
            require(':');
            map.set(std::move(key), ValueBox{read_value()});
        } while (accept(','));
        require('}');
        return Value{map.persistent()};
    }

    Value read_array() {
        require('[');
        auto vec = ValueVector{}.transient();
        if (accept(']')) {
            return Value{vec.persistent()};
        }
        do {
            vec.push_back(ValueBox{read_value()});
        } while (accept(','));
        require(']');
        return Value{vec.persistent()};
    }

    std::string read_string() {
        require('"');
        std::string out;
        while (!at_end()) {
            const char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (at_end()) {
                break;
            }
            const char escape = text_[pos_++];
            switch (escape) {
                case '"':
                case '\\':
                case '/': out += escape; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': append_utf8(out, read_code_point()); break;
                default:  fail("invalid escape");
            }
        }
        fail("unterminated string");
    }

    std::uint32_t read_hex4() {
        std::uint32_t unit = 0;
        const auto digits = text_.substr(pos_, 4);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), unit, 16);
        if (digits.size() != 4 || ec != std::errc{} || ptr != digits.data() + 4) {
            fail("invalid unicode escape");
        }
        pos_ += 4;
        return unit;
    }

    /// Code point of a unicode escape, joining a UTF-16 surrogate pair
    std::uint32_t read_code_point() {
        const auto high = read_hex4();
        if (high < 0xD800 || high > 0xDBFF) {
            return high;
        }
        if (text_.substr(pos_, 2) != "\\u") {
            fail("unpaired surrogate");
        }
        pos_ += 2;
        const auto low = read_hex4();
        if (low < 0xDC00 || low > 0xDFFF) {
            fail("unpaired surrogate");
        }
        return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
    }

    static void append_utf8(std::string& out, std::uint32_t cp) {
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

    /// Integers become int32 when they fit, int64 otherwise; anything with
    /// a fraction or exponent, or beyond int64, becomes a double
    Value read_number() {
        const auto start = pos_;
        bool integral = true;
        if (text_[pos_] == '-') {
            ++pos_;
        }
        while (!at_end()) {
            const char c = text_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' || ((c == '+' || c == '-') && !integral)) {
                integral = false;
                ++pos_;
            } else {
                break;
            }
        }
        const auto token = text_.substr(start, pos_ - start);
        if (token.empty() || token == "-") {
            fail("unexpected character");
        }

        if (integral) {
            int64_t n = 0;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), n);
            if (ec == std::errc{} && ptr == token.data() + token.size()) {
                if (n >= std::numeric_limits<int32_t>::min() && n <= std::numeric_limits<int32_t>::max()) {
                    return Value{static_cast<int32_t>(n)};
                }
                return Value{n};
            }
            if (ec != std::errc::result_out_of_range) {
                fail("invalid number");
            }
        }

        double d = 0.0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), d);
        if (ec != std::errc{} || ptr != token.data() + token.size()) {
            fail("invalid number");
        }
        return Value{d};
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    JsonWriter writer(compact);
    writer.write(val, 0);
    return writer.str();
}

Value from_json(const std::string& json_str, std::string* error_out)
{
    try {
        return JsonReader{json_str}.read_document();
    } catch (const std::runtime_error& e) {
        if (error_out) {
            *error_out = e.what();
        }
        return Value{};
    }
}

std::string json_quote(const std::string& s)
{
    return "\"" + json_escape_string(s) + "\"";
}

std::string format_timestamp(Timestamp ts)
{
    using namespace std::chrono;

    const auto day_point = floor<days>(ts);
    const year_month_day ymd{day_point};
    const hh_mm_ss hms{floor<nanoseconds>(ts - day_point)};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()));

    std::string result = buf;
    const auto fraction = hms.subseconds().count();
    if (fraction != 0) {
        std::snprintf(buf, sizeof(buf), ".%09lld", static_cast<long long>(fraction));
        std::string digits = buf;
        digits.erase(digits.find_last_not_of('0') + 1);
        result += digits;
    }
    result += 'Z';
    return result;
}

std::string format_number(double value)
{
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

} // namespace diffit
