/**
 * HTML Parser implementation
 */

#include "quarry/html/parser.hpp"
#include "quarry/core/logger.hpp"

namespace quarry::html {

namespace {

std::string_view strip_utf8_bom(std::string_view input) {
    if (input.size() >= 3 && static_cast<unsigned char>(input[0]) == 0xEF &&
        static_cast<unsigned char>(input[1]) == 0xBB &&
        static_cast<unsigned char>(input[2]) == 0xBF) {
        return input.substr(3);
    }
    return input;
}

} // namespace

RefPtr<dom::Element> Parser::parse(std::string_view html) {
    DOMBuilder builder(m_options);
    run(html, builder);
    return builder.root();
}

std::vector<RefPtr<dom::Node>> Parser::parse_fragment(std::string_view html) {
    DOMBuilder builder(m_options);
    run(html, builder);
    return builder.top_level_nodes();
}

void Parser::run(std::string_view html, DOMBuilder& builder) {
    m_errors.clear();

    Tokenizer tokenizer(strip_utf8_bom(html));
    tokenizer.set_error_callback([this](const String& message, SourcePosition position) {
        on_parse_error(message, position);
    });
    builder.set_error_callback([this](const String& message, SourcePosition position) {
        on_parse_error(message, position);
    });

    while (auto token = tokenizer.next_token()) {
        builder.process_token(*token);
    }

    auto& log = logging::get("html");
    if (!m_errors.empty() && log.is_enabled(LogLevel::Debug)) {
        StringBuilder sb;
        sb.append("parsed with ");
        sb.append(static_cast<u64>(m_errors.size()));
        sb.append(" recovered errors");
        log.debug(sb.view());
    }
}

void Parser::on_parse_error(const String& message, SourcePosition position) {
    m_errors.push_back({message, position});
    if (m_error_callback) {
        m_error_callback(message, position);
    }
}

RefPtr<dom::Element> parse_html(std::string_view html, ParseOptions options) {
    Parser parser(options);
    return parser.parse(html);
}

std::vector<RefPtr<dom::Node>> parse_html_fragment(std::string_view html, ParseOptions options) {
    Parser parser(options);
    return parser.parse_fragment(html);
}

} // namespace quarry::html
