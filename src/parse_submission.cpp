#include "tracker/submission.hpp"

#include <cstdint>
#include <optional>

namespace tracker {

// ============================================================================
// Submission
// ============================================================================

void Submission::set(std::string key, FieldValue value) {
    for (auto& field : fields_) {
        if (field.key == key) {
            field.value = std::move(value);
            return;
        }
    }
    fields_.push_back(SubmissionField{std::move(key), std::move(value)});
}

const FieldValue* Submission::find(std::string_view key) const noexcept {
    for (const auto& field : fields_) {
        if (field.key == key) {
            return &field.value;
        }
    }
    return nullptr;
}

namespace {

bool is_json_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_utf8(std::string& out, std::uint32_t cp) {
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

constexpr std::uint32_t kReplacementChar = 0xFFFD;

// Single-pass JSON object reader.
// Builds a flat Submission from the top-level object; nested objects and
// arrays are syntax-checked and kept as raw text.
class JsonObjectParser {
public:
    explicit JsonObjectParser(std::string_view input) noexcept
        : input_(input), pos_(0), depth_(0) {}

    SubmissionResult parse() {
        // Invariant 1: Check size bound before any parsing
        if (input_.size() > SubmissionLimits::kMaxInputBytes) {
            return SubmissionDrop::InputTooLarge;
        }

        Submission result;

        skip_whitespace();
        if (pos_ >= input_.size()) {
            // Empty body parses as an empty object
            return result;
        }
        if (peek() != '{') {
            if (!skip_value()) {
                return SubmissionDrop::InvalidJson;
            }
            return SubmissionDrop::NotAnObject;
        }
        advance();

        skip_whitespace();
        if (peek() == '}') {
            advance();
            return finish(std::move(result));
        }

        while (true) {
            skip_whitespace();

            auto key = parse_string();
            if (!key) {
                return SubmissionDrop::InvalidJson;
            }
            if (key->size() > SubmissionLimits::kMaxKeyLen) {
                return SubmissionDrop::KeyTooLong;
            }

            skip_whitespace();
            if (!expect(':')) {
                return SubmissionDrop::InvalidJson;
            }
            skip_whitespace();

            auto value = parse_value();
            if (!value) {
                return nesting_exceeded_ ? SubmissionDrop::NestingTooDeep
                                         : SubmissionDrop::InvalidJson;
            }

            // Invariant 2: Bound field count (duplicates replace in place)
            if (!result.contains(*key) &&
                result.size() >= SubmissionLimits::kMaxFields) {
                return SubmissionDrop::TooManyFields;
            }
            result.set(std::move(*key), std::move(*value));

            skip_whitespace();
            if (peek() == '}') {
                advance();
                break;
            }
            if (!expect(',')) {
                return SubmissionDrop::InvalidJson;
            }
        }

        return finish(std::move(result));
    }

private:
    std::string_view input_;
    std::size_t pos_;
    std::size_t depth_;
    bool nesting_exceeded_ = false;

    // Only whitespace may follow the top-level object
    SubmissionResult finish(Submission result) {
        skip_whitespace();
        if (pos_ != input_.size()) {
            return SubmissionDrop::InvalidJson;
        }
        return result;
    }

    char peek() const noexcept {
        return (pos_ < input_.size()) ? input_[pos_] : '\0';
    }

    char advance() noexcept {
        return (pos_ < input_.size()) ? input_[pos_++] : '\0';
    }

    bool expect(char c) noexcept {
        if (pos_ < input_.size() && input_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_whitespace() noexcept {
        while (pos_ < input_.size() && is_json_space(input_[pos_])) {
            ++pos_;
        }
    }

    std::optional<FieldValue> parse_value() {
        char c = peek();
        std::size_t start = pos_;

        if (c == '"') {
            auto s = parse_string();
            if (!s) return std::nullopt;
            return FieldValue{ValueKind::String, std::move(*s)};
        }
        if (c == '{' || c == '[') {
            if (!skip_value()) return std::nullopt;
            return FieldValue{ValueKind::Raw,
                              std::string(input_.substr(start, pos_ - start))};
        }
        if (c == 't' || c == 'f') {
            if (!skip_literal()) return std::nullopt;
            return FieldValue{ValueKind::Bool,
                              std::string(input_.substr(start, pos_ - start))};
        }
        if (c == 'n') {
            if (!skip_literal()) return std::nullopt;
            return FieldValue{ValueKind::Null, "null"};
        }
        if (c == '-' || is_digit(c)) {
            if (!skip_number()) return std::nullopt;
            return FieldValue{ValueKind::Number,
                              std::string(input_.substr(start, pos_ - start))};
        }
        return std::nullopt;
    }

    // Parse a JSON string and decode its escapes
    std::optional<std::string> parse_string() {
        if (!expect('"')) {
            return std::nullopt;
        }

        std::string out;
        while (pos_ < input_.size()) {
            char c = input_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;  // raw control characters are not allowed
            }
            if (c != '\\') {
                out += c;
                continue;
            }

            if (pos_ >= input_.size()) {
                return std::nullopt;
            }
            char e = input_[pos_++];
            switch (e) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    auto cp = parse_unicode_escape();
                    if (!cp) return std::nullopt;
                    append_utf8(out, *cp);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;  // Unterminated string
    }

    std::optional<std::uint32_t> read_hex4() noexcept {
        if (input_.size() - pos_ < 4) {
            return std::nullopt;
        }
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            int h = hex_value(input_[pos_++]);
            if (h < 0) return std::nullopt;
            v = (v << 4) | static_cast<std::uint32_t>(h);
        }
        return v;
    }

    // After "\u": one code unit, or a surrogate pair.
    // Unpaired surrogates decode to U+FFFD.
    std::optional<std::uint32_t> parse_unicode_escape() noexcept {
        auto hi = read_hex4();
        if (!hi) return std::nullopt;

        if (*hi >= 0xDC00 && *hi <= 0xDFFF) {
            return kReplacementChar;
        }
        if (*hi < 0xD800 || *hi > 0xDBFF) {
            return *hi;
        }

        if (input_.substr(pos_).starts_with("\\u")) {
            std::size_t save = pos_;
            pos_ += 2;
            auto lo = read_hex4();
            if (!lo) return std::nullopt;
            if (*lo >= 0xDC00 && *lo <= 0xDFFF) {
                return 0x10000 + ((*hi - 0xD800) << 10) + (*lo - 0xDC00);
            }
            // Not a low surrogate: leave it for the caller to decode next
            pos_ = save;
        }
        return kReplacementChar;
    }

    // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    bool skip_number() noexcept {
        expect('-');

        if (peek() == '0') {
            advance();
        } else if (is_digit(peek())) {
            while (is_digit(peek())) advance();
        } else {
            return false;
        }

        if (peek() == '.') {
            advance();
            if (!is_digit(peek())) return false;
            while (is_digit(peek())) advance();
        }

        if (peek() == 'e' || peek() == 'E') {
            advance();
            if (peek() == '+' || peek() == '-') advance();
            if (!is_digit(peek())) return false;
            while (is_digit(peek())) advance();
        }
        return true;
    }

    bool skip_literal() noexcept {
        // true, false, null
        std::string_view rest = input_.substr(pos_);
        for (std::string_view lit : {"true", "false", "null"}) {
            if (rest.starts_with(lit)) {
                pos_ += lit.size();
                return true;
            }
        }
        return false;
    }

    bool skip_value() {
        skip_whitespace();
        char c = peek();

        if (c == '"') {
            return parse_string().has_value();
        } else if (c == '{') {
            return skip_object();
        } else if (c == '[') {
            return skip_array();
        } else if (c == 't' || c == 'f' || c == 'n') {
            return skip_literal();
        } else if (c == '-' || is_digit(c)) {
            return skip_number();
        }
        return false;
    }

    bool enter() noexcept {
        if (++depth_ > SubmissionLimits::kMaxNestingDepth) {
            nesting_exceeded_ = true;
            return false;
        }
        return true;
    }

    bool skip_object() {
        if (!expect('{')) return false;
        if (!enter()) return false;

        skip_whitespace();
        if (peek() == '}') {
            advance();
            --depth_;
            return true;
        }

        while (true) {
            skip_whitespace();
            if (!parse_string()) return false;
            skip_whitespace();
            if (!expect(':')) return false;
            if (!skip_value()) return false;
            skip_whitespace();
            if (peek() == '}') {
                advance();
                --depth_;
                return true;
            }
            if (!expect(',')) return false;
        }
    }

    bool skip_array() {
        if (!expect('[')) return false;
        if (!enter()) return false;

        skip_whitespace();
        if (peek() == ']') {
            advance();
            --depth_;
            return true;
        }

        while (true) {
            if (!skip_value()) return false;
            skip_whitespace();
            if (peek() == ']') {
                advance();
                --depth_;
                return true;
            }
            if (!expect(',')) return false;
        }
    }
};

// Decode one form component: '+' -> ' ', %XX -> byte.
// A '%' not followed by two hex digits is kept literally.
std::string form_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < s.size() &&
                   hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out += static_cast<char>((hex_value(s[i + 1]) << 4) | hex_value(s[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

}  // namespace

BodyFormat body_format_from_content_type(std::string_view content_type) noexcept {
    std::string_view media = content_type.substr(0, content_type.find(';'));
    media = trim(media);

    if (iequals(media, "application/json")) {
        return BodyFormat::Json;
    }
    if (iequals(media, "application/x-www-form-urlencoded")) {
        return BodyFormat::Form;
    }
    return BodyFormat::Unknown;
}

SubmissionResult parse_json_submission(std::string_view body) {
    JsonObjectParser parser(body);
    return parser.parse();
}

SubmissionResult parse_form_submission(std::string_view body) {
    if (body.size() > SubmissionLimits::kMaxInputBytes) {
        return SubmissionDrop::InputTooLarge;
    }

    Submission result;
    std::size_t pos = 0;
    while (pos <= body.size()) {
        std::size_t amp = body.find('&', pos);
        if (amp == std::string_view::npos) {
            amp = body.size();
        }
        std::string_view pair = body.substr(pos, amp - pos);
        pos = amp + 1;

        if (pair.empty()) {
            continue;
        }

        std::size_t eq = pair.find('=');
        std::string key = form_decode(pair.substr(0, eq));
        std::string value = (eq == std::string_view::npos)
                                ? std::string{}
                                : form_decode(pair.substr(eq + 1));

        if (key.empty()) {
            continue;
        }
        if (key.size() > SubmissionLimits::kMaxKeyLen) {
            return SubmissionDrop::KeyTooLong;
        }
        if (!result.contains(key) && result.size() >= SubmissionLimits::kMaxFields) {
            return SubmissionDrop::TooManyFields;
        }
        result.set(std::move(key), string_value(std::move(value)));
    }
    return result;
}

SubmissionResult parse_submission(std::string_view body, BodyFormat format) {
    switch (format) {
        case BodyFormat::Json:
            return parse_json_submission(body);
        case BodyFormat::Form:
            return parse_form_submission(body);
        case BodyFormat::Unknown:
            break;
    }
    return Submission{};
}

std::string_view to_string(SubmissionDrop reason) noexcept {
    switch (reason) {
        case SubmissionDrop::InputTooLarge:  return "input too large";
        case SubmissionDrop::InvalidJson:    return "invalid json";
        case SubmissionDrop::NotAnObject:    return "not an object";
        case SubmissionDrop::NestingTooDeep: return "nesting too deep";
        case SubmissionDrop::TooManyFields:  return "too many fields";
        case SubmissionDrop::KeyTooLong:     return "key too long";
    }
    return "unknown";
}

}  // namespace tracker
