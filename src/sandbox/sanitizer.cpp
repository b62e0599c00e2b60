#include "sandbox/sanitizer.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <cctype>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static const string ILLEGAL_CHARACTERS = "\\<>:\"|?*";

input_sanitizer::input_sanitizer(const evaluation_config &config)
    : max_file_size(config.max_file_size_bytes),
      forbidden_tokens(config.forbidden_tokens) {
    for (const string &ext : config.allowed_extensions)
        allowed_extensions.push_back(boost::algorithm::to_lower_copy(ext));
    for (const string &ext : config.header_extensions)
        header_extensions.push_back(boost::algorithm::to_lower_copy(ext));
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

string percent_decode(const string &text) {
    string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int high = hex_value(text[i + 1]), low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                result.push_back((char)(high * 16 + low));
                i += 2;
                continue;
            }
        }
        result.push_back(text[i]);
    }
    return result;
}

static bool has_extension(const vector<string> &extensions, const fs::path &name) {
    string ext = boost::algorithm::to_lower_copy(name.extension().string());
    return !ext.empty() && find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

bool input_sanitizer::is_header(const fs::path &name) const {
    return has_extension(header_extensions, name);
}

fs::path input_sanitizer::sanitize(const string &name, size_t size, const fs::path &destination_dir, file_kind kind) const {
    if (name.empty())
        throw validation_error("File name should not be empty");

    string decoded = percent_decode(name);
    if (decoded.size() > MAX_NAME_LENGTH)
        throw validation_error(fmt::format("File name is longer than {} characters", MAX_NAME_LENGTH));

    for (char c : decoded) {
        if ((unsigned char)c < 0x20 || c == 0x7f)
            throw validation_error("File name contains control characters");
        if (ILLEGAL_CHARACTERS.find(c) != string::npos)
            throw validation_error(fmt::format("File name contains illegal character '{}'", c));
    }

    // "a/../b.cpp" 规范化后不再含有 ".."，因此规范化前后都要检查
    for (const fs::path &segment : fs::path(decoded))
        if (segment == "..")
            throw validation_error("Path traversal is not allowed: " + name);

    fs::path normalized = fs::path(decoded).lexically_normal();
    if (normalized.empty() || normalized == ".")
        throw validation_error("File name should not be empty");
    if (normalized.is_absolute() || normalized.has_root_directory())
        throw validation_error("Absolute paths are not allowed: " + name);
    for (const fs::path &segment : normalized) {
        string part = segment.string();
        if (part == "..")
            throw validation_error("Path traversal is not allowed: " + name);
        if (!part.empty() && part[0] == '~')
            throw validation_error("Home directory references are not allowed: " + name);
    }
    if (!normalized.has_filename())
        throw validation_error("File name should not be a directory: " + name);

    bool allowed = has_extension(allowed_extensions, normalized) ||
                   (kind == file_kind::TEST_UNIT && is_header(normalized));
    if (!allowed)
        throw validation_error(fmt::format("File extension of {} is not allowed", normalized.filename().string()));

    if (size == 0)
        throw validation_error("File " + normalized.string() + " is empty");
    if (size > max_file_size)
        throw validation_error(fmt::format("File {} exceeds the size limit of {} bytes", normalized.string(), max_file_size));

    fs::path root = fs::absolute(destination_dir).lexically_normal();
    fs::path destination = (root / normalized).lexically_normal();
    if (!is_subpath(destination, root))
        throw validation_error("File " + name + " escapes the sandbox directory");
    return destination;
}

void input_sanitizer::validate_identifier(const string &id, const string &field) const {
    if (id.empty())
        throw validation_error(field + " should not be empty");
    if (id.size() > MAX_IDENTIFIER_LENGTH)
        throw validation_error(fmt::format("{} is longer than {} characters", field, MAX_IDENTIFIER_LENGTH));
    for (char c : id)
        if (!isalnum((unsigned char)c) && c != '_' && c != '-')
            throw validation_error(field + " contains invalid characters");
    if (id.front() == '_' || id.front() == '-' || id.back() == '_' || id.back() == '-')
        throw validation_error(field + " should not start or end with '_' or '-'");
}

void input_sanitizer::screen_content(const string &content, const string &field) const {
    if (boost::algorithm::trim_copy(content).empty())
        throw validation_error(field + " should not be empty");
    for (const string &token : forbidden_tokens)
        if (!token.empty() && content.find(token) != string::npos)
            throw validation_error(fmt::format("{} contains forbidden token '{}'", field, token));
}

}  // namespace grader
