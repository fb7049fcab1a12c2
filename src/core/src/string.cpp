#include "quarry/core/string.hpp"
#include <algorithm>
#include <charconv>

namespace quarry {

// ============================================================================
// UTF-8 implementation
// ============================================================================

namespace unicode {

usize utf8_encode(CodePoint cp, char* buffer) {
    if (cp < 0x80) {
        buffer[0] = static_cast<char>(cp);
        return 1;
    }
    if (cp < 0x800) {
        buffer[0] = static_cast<char>(0xC0 | (cp >> 6));
        buffer[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        buffer[0] = static_cast<char>(0xE0 | (cp >> 12));
        buffer[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    }
    if (cp <= 0x10FFFF) {
        buffer[0] = static_cast<char>(0xF0 | (cp >> 18));
        buffer[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buffer[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

} // namespace unicode

// ============================================================================
// String implementation
// ============================================================================

String::String(const char* str) : m_data(str ? str : "") {}

String::String(const char* str, usize length) : m_data(str, length) {}

String::String(std::string str) : m_data(std::move(str)) {}

String::String(std::string_view sv) : m_data(sv) {}

String String::from_code_point(unicode::CodePoint cp) {
    String result;
    result.append(cp);
    return result;
}

void String::append(const String& other) {
    m_data.append(other.m_data);
}

void String::append(std::string_view sv) {
    m_data.append(sv);
}

void String::append(unicode::CodePoint cp) {
    char buffer[4];
    usize len = unicode::utf8_encode(cp, buffer);
    m_data.append(buffer, len);
}

std::optional<usize> String::find(const String& needle, usize start) const {
    auto pos = m_data.find(needle.m_data, start);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

std::optional<usize> String::find(char c, usize start) const {
    auto pos = m_data.find(c, start);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

bool String::contains(const String& needle) const {
    return m_data.find(needle.m_data) != std::string::npos;
}

bool String::starts_with(const String& prefix) const {
    return m_data.starts_with(prefix.m_data);
}

bool String::ends_with(const String& suffix) const {
    return m_data.ends_with(suffix.m_data);
}

String String::to_lowercase() const {
    std::string result(m_data);
    std::transform(result.begin(), result.end(), result.begin(), [](char c) {
        return static_cast<char>(unicode::to_ascii_lower(static_cast<u8>(c)));
    });
    return String(std::move(result));
}

std::vector<String> String::split_whitespace() const {
    std::vector<String> result;
    usize start = 0;
    for (usize i = 0; i <= m_data.size(); ++i) {
        if (i == m_data.size() || unicode::is_ascii_whitespace(static_cast<u8>(m_data[i]))) {
            if (i > start) {
                result.emplace_back(m_data.substr(start, i - start));
            }
            start = i + 1;
        }
    }
    return result;
}

bool String::contains_whitespace() const {
    return std::any_of(m_data.begin(), m_data.end(), [](char c) {
        return unicode::is_ascii_whitespace(static_cast<u8>(c));
    });
}

bool String::equals_ignore_case(const String& other) const {
    if (m_data.size() != other.m_data.size()) {
        return false;
    }
    for (usize i = 0; i < m_data.size(); ++i) {
        if (unicode::to_ascii_lower(static_cast<u8>(m_data[i])) !=
            unicode::to_ascii_lower(static_cast<u8>(other.m_data[i]))) {
            return false;
        }
    }
    return true;
}

String String::operator+(const String& other) const {
    return String(m_data + other.m_data);
}

String& String::operator+=(const String& other) {
    m_data += other.m_data;
    return *this;
}

String& String::operator+=(std::string_view sv) {
    m_data += sv;
    return *this;
}

// ============================================================================
// StringBuilder implementation
// ============================================================================

StringBuilder& StringBuilder::append(const String& str) {
    m_buffer.append(str.std_string());
    return *this;
}

StringBuilder& StringBuilder::append(std::string_view sv) {
    m_buffer.append(sv);
    return *this;
}

StringBuilder& StringBuilder::append(const char* str) {
    if (str) {
        m_buffer.append(str);
    }
    return *this;
}

StringBuilder& StringBuilder::append(char c) {
    m_buffer.push_back(c);
    return *this;
}

StringBuilder& StringBuilder::append(unicode::CodePoint cp) {
    char buffer[4];
    usize len = unicode::utf8_encode(cp, buffer);
    m_buffer.append(buffer, len);
    return *this;
}

StringBuilder& StringBuilder::append(u64 value) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    m_buffer.append(buffer, static_cast<usize>(result.ptr - buffer));
    return *this;
}

} // namespace quarry
