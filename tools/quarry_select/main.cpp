/**
 * Selector query CLI
 * Usage: quarry-select [--strict] [--first] [--count] [--text]
 *                      [--log-level LEVEL] SELECTOR [file.html]
 * Reads stdin when no file is given.
 */

#include "quarry/html/parser.hpp"
#include "quarry/css/selector_parser.hpp"
#include "quarry/core/logger.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

using namespace quarry;

namespace {

struct Options {
    html::ParseOptions parse;
    bool first{false};
    bool count{false};
    bool text{false};
    LogLevel log_level{LogLevel::Warn};
    String selector;
    std::optional<String> file;
};

void print_usage() {
    std::cerr << "Usage: quarry-select [--strict] [--first] [--count] [--text] "
                 "[--log-level LEVEL] SELECTOR [FILE]\n";
}

std::optional<Options> parse_arguments(int argc, char* argv[]) {
    Options options;
    std::vector<String> positional;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--strict") {
            options.parse.strict = true;
        } else if (arg == "--first") {
            options.first = true;
        } else if (arg == "--count") {
            options.count = true;
        } else if (arg == "--text") {
            options.text = true;
        } else if (arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-level needs a value\n";
                return std::nullopt;
            }
            auto level = parse_log_level(argv[++i]);
            if (!level) {
                std::cerr << "Error: Unknown log level: " << argv[i] << "\n";
                return std::nullopt;
            }
            options.log_level = *level;
        } else if (arg.size() > 1 && arg.front() == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            positional.emplace_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        return std::nullopt;
    }
    options.selector = positional[0];
    if (positional.size() == 2) {
        options.file = positional[1];
    }
    return options;
}

void print_element(const dom::Element& element, bool text_only) {
    if (text_only) {
        std::cout << element.text_content() << "\n";
        return;
    }

    std::cout << "<" << element.tag_name();
    for (const auto& attr : element.attributes()) {
        std::cout << " " << attr.name << "=\"" << attr.value << "\"";
    }
    std::cout << ">\n";
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage();
        return 1;
    }

    logging::init();
    logging::set_level(options->log_level);

    css::SelectorGroup group;
    try {
        group = css::SelectorGroup::from_string(options->selector);
    } catch (const css::SelectorParserException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        logging::shutdown();
        return 2;
    }

    std::stringstream buffer;
    if (options->file) {
        std::ifstream file(options->file->c_str());
        if (!file) {
            std::cerr << "Error: Cannot open file: " << *options->file << "\n";
            logging::shutdown();
            return 1;
        }
        buffer << file.rdbuf();
    } else {
        buffer << std::cin.rdbuf();
    }
    std::string source = buffer.str();

    html::Parser parser(options->parse);
    std::vector<RefPtr<dom::Node>> forest;
    try {
        forest = parser.parse_fragment(source);
    } catch (const html::DOMBuilderException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        logging::shutdown();
        return 3;
    }

    std::vector<dom::Element*> matches;
    for (const auto& node : forest) {
        if (options->first) {
            if (auto* element = node->select(group)) {
                matches.push_back(element);
                break;
            }
        } else {
            auto found = node->select_all(group);
            matches.insert(matches.end(), found.begin(), found.end());
        }
    }

    if (logging::default_logger().is_enabled(LogLevel::Info)) {
        StringBuilder sb;
        sb.append("matched ");
        sb.append(static_cast<u64>(matches.size()));
        sb.append(" elements in ");
        sb.append(static_cast<u64>(forest.size()));
        sb.append(" top-level nodes");
        QUARRY_LOG_INFO(sb.view());
    }

    if (options->count) {
        std::cout << matches.size() << "\n";
    } else {
        for (const auto* element : matches) {
            print_element(*element, options->text);
        }
    }

    logging::shutdown();
    return 0;
}
