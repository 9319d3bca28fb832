/**
 * @file message_sanitizer.cpp
 * @brief Redaction pipeline implementation
 */

#include "dependabot/errors/message_sanitizer.h"
#include "dependabot/common/config_manager.h"
#include "dependabot/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>

namespace dependabot::errors {

namespace {

constexpr const char* SCHEME_SEPARATOR = "://";
constexpr const char* FURY_IO_PATH = "fury.io/";
constexpr const char* ENCODED_AT = "%40";

bool isTmpNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-';
}

bool isPasswordChar(char c) {
    return c != '@' && c != '%' && c != '/' &&
           !std::isspace(static_cast<unsigned char>(c));
}

/**
 * @brief Length of a "user:password@" (or "...%40") run starting at @p start
 *
 * The user part stops at the first ':' and may not contain '@'. The password
 * is non-empty and ends at the first '@', '%', '/' or whitespace, which must
 * be '@' or "%40".
 *
 * @return Length including the terminator, 0 when there is no credential
 */
size_t credentialLength(const std::string& text, size_t start) {
    size_t colon = text.find_first_of(":@", start);
    if (colon == std::string::npos || text[colon] != ':') {
        return 0;
    }

    size_t end = colon + 1;
    while (end < text.size() && isPasswordChar(text[end])) {
        ++end;
    }
    if (end == colon + 1 || end == text.size()) {
        return 0;
    }

    if (text[end] == '@') {
        return end + 1 - start;
    }
    if (text.compare(end, 3, ENCODED_AT) == 0) {
        return end + 3 - start;
    }
    return 0;
}

// ://user:password@ or ://user:password%40
std::vector<std::string> basicAuthCaptures(const std::string& text) {
    std::vector<std::string> captures;
    size_t pos = text.find(SCHEME_SEPARATOR);
    while (pos != std::string::npos) {
        size_t start = pos + 3;
        size_t length = credentialLength(text, start);
        if (length > 0) {
            captures.push_back(text.substr(start, length));
            pos = text.find(SCHEME_SEPARATOR, start + length);
        } else {
            pos = text.find(SCHEME_SEPARATOR, pos + 1);
        }
    }
    return captures;
}

// Remove any path segment from fury.io sources, up to the end of the line
std::vector<std::string> furyIoPathCaptures(const std::string& text) {
    std::vector<std::string> captures;
    const size_t anchorLength = std::char_traits<char>::length(FURY_IO_PATH);
    size_t pos = text.find(FURY_IO_PATH);
    while (pos != std::string::npos) {
        size_t start = pos + anchorLength;
        size_t end = text.find_first_of("\r\n", start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            captures.push_back(text.substr(start, end - start));
            pos = text.find(FURY_IO_PATH, end);
        } else {
            pos = text.find(FURY_IO_PATH, pos + 1);
        }
    }
    return captures;
}

} // namespace

SanitizerConfig SanitizerConfig::fromConfigManager() {
    using common::ConfigManager;
    const auto& config = ConfigManager::getInstance();
    return SanitizerConfig{
        config.getString(ConfigManager::TMP_DIR_PATH, ConfigManager::DEFAULT_TMP_DIR_PATH),
        config.getString(ConfigManager::TMP_FILE_PREFIX, ConfigManager::DEFAULT_TMP_FILE_PREFIX)
    };
}

MessageSanitizer::MessageSanitizer(SanitizerConfig config)
    : config_(std::move(config)),
      tmpPathAnchor_(config_.tmpDirPath + "/" + config_.tmpFilePrefix) {}

const MessageSanitizer& MessageSanitizer::instance() {
    static std::unique_ptr<MessageSanitizer> instance;
    static std::once_flag initFlag;
    std::call_once(initFlag, []() {
        instance = std::make_unique<MessageSanitizer>(SanitizerConfig::fromConfigManager());
        spdlog::debug("MessageSanitizer initialized: tmpDirPath={}, tmpFilePrefix={}",
                      instance->config_.tmpDirPath, instance->config_.tmpFilePrefix);
    });
    return *instance;
}

SanitizedMessage MessageSanitizer::sanitize(const std::string& message) const {
    // <root>/<prefix>[a-zA-Z0-9-]* -> dependabot_tmp_dir
    std::string collapsed;
    collapsed.reserve(message.size());
    size_t pos = 0;
    size_t found;
    while ((found = message.find(tmpPathAnchor_, pos)) != std::string::npos) {
        size_t end = found + tmpPathAnchor_.size();
        while (end < message.size() && isTmpNameChar(message[end])) {
            ++end;
        }
        collapsed.append(message, pos, found - pos);
        collapsed += TMP_DIR_TOKEN;
        pos = end;
    }
    collapsed.append(message, pos, std::string::npos);

    return SanitizedMessage(filterSensitiveData(utils::trim(collapsed)));
}

std::optional<SanitizedMessage> MessageSanitizer::sanitizeOptional(
    const std::optional<std::string>& message) const {
    if (!message) {
        return std::nullopt;
    }
    return sanitize(*message);
}

std::string MessageSanitizer::filterSensitiveData(const std::string& text) const {
    return replaceCaptures(text, basicAuthCaptures(text), "");
}

std::string MessageSanitizer::sanitizeSource(const std::string& source) const {
    std::string filtered = filterSensitiveData(source);
    return replaceCaptures(filtered, furyIoPathCaptures(filtered), REDACTED_TOKEN);
}

std::string MessageSanitizer::replaceCaptures(const std::string& text,
                                              const std::vector<std::string>& captures,
                                              const std::string& replacement) {
    std::vector<std::string> distinct;
    for (const auto& captured : captures) {
        if (!captured.empty() &&
            std::find(distinct.begin(), distinct.end(), captured) == distinct.end()) {
            distinct.push_back(captured);
        }
    }

    if (distinct.empty()) {
        return text;
    }

    std::string result = text;
    for (const auto& captured : distinct) {
        result = utils::replaceAll(result, captured, replacement);
    }

    spdlog::debug("Redacted {} sensitive fragment(s) from error text", distinct.size());
    return result;
}

} // namespace dependabot::errors
