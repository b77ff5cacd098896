#include <clusterlb/config/config.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace clusterlb::config {

namespace {

std::string_view Describe(chjson::error_code code) {
    switch (code) {
        case chjson::error_code::ok: return "no error";
        case chjson::error_code::unexpected_eof: return "unexpected end of input";
        case chjson::error_code::invalid_value: return "unrecognized value";
        case chjson::error_code::invalid_number: return "malformed number";
        case chjson::error_code::invalid_string: return "malformed string";
        case chjson::error_code::invalid_escape: return "bad escape sequence";
        case chjson::error_code::invalid_unicode_escape: return "bad \\u escape";
        case chjson::error_code::invalid_utf16_surrogate: return "unpaired UTF-16 surrogate";
        case chjson::error_code::expected_colon: return "expected ':' after key";
        case chjson::error_code::expected_comma_or_end: return "expected ',' or closing bracket";
        case chjson::error_code::expected_key_string: return "object key must be a string";
        case chjson::error_code::trailing_characters: return "trailing characters after value";
        case chjson::error_code::nesting_too_deep: return "nesting too deep";
        case chjson::error_code::out_of_memory: return "out of memory";
    }
    return "unknown parse error";
}

clusterlb::Status KeyError(clusterlb::StatusCode code, const char* what, std::string_view key) {
    std::string msg(what);
    msg.append(": ");
    msg.append(key);
    return clusterlb::Status(code, std::move(msg));
}

} // namespace

clusterlb::Result<Config> Config::LoadFile(std::string path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return clusterlb::Status(clusterlb::StatusCode::not_found, "config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return LoadString(ss.str());
}

clusterlb::Result<Config> Config::LoadString(std::string_view text) {
    std::string buf(text);
    auto r = chjson::parse(buf);
    if (r.err) {
        std::ostringstream oss;
        oss << "invalid json at " << r.err.line << ":" << r.err.column << ": " << Describe(r.err.code);
        return clusterlb::Status(clusterlb::StatusCode::invalid_argument, oss.str());
    }

    if (!r.doc.root().is_object()) {
        return clusterlb::Status(clusterlb::StatusCode::invalid_argument, "config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

bool Config::Has(std::string_view key) const {
    return doc_.root().find(key) != nullptr;
}

clusterlb::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return KeyError(clusterlb::StatusCode::not_found, "missing key", key);
    }
    if (!v->is_string()) {
        return KeyError(clusterlb::StatusCode::invalid_argument, "not a string", key);
    }
    return std::string(v->as_string_view());
}

clusterlb::Result<int> Config::GetInt(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return KeyError(clusterlb::StatusCode::not_found, "missing key", key);
    }
    if (!v->is_number() || !v->is_int()) {
        return KeyError(clusterlb::StatusCode::invalid_argument, "not an int", key);
    }
    const auto raw = static_cast<std::int64_t>(v->as_int());
    if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
        return KeyError(clusterlb::StatusCode::invalid_argument, "int out of range", key);
    }
    return static_cast<int>(raw);
}

} // namespace clusterlb::config
