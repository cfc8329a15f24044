#include "OptionParser.hpp"

#include <charconv>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>

namespace CP::Cli {

OptionParser::OptionParser() {
    unknown_handler_ = [this](std::string_view token) {
        std::string message = "unknown argument '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        log_error(message);
        return false;
    };
}

void OptionParser::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void OptionParser::set_unknown_argument_handler(std::function<bool(std::string_view)> handler) {
    unknown_handler_ = std::move(handler);
}

void OptionParser::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void OptionParser::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help         = std::move(option.help);
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void OptionParser::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help          = std::move(option.help);
    entry.value_name    = std::move(option.value_name);
    entry.expects_value = true;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void OptionParser::add_string(std::string_view name, std::string& target, std::string help) {
    ValueOption value_opt{};
    value_opt.help     = std::move(help);
    value_opt.on_value = [&target, stored = std::string(name)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires a non-empty value";
        }
        target.assign(token.begin(), token.end());
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void OptionParser::add_double(std::string_view name, DoubleOption option) {
    ValueOption value_opt{};
    value_opt.help       = std::move(option.help);
    value_opt.value_name = "NUMBER";
    value_opt.on_value   = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires a floating-point value";
        }
        std::string       buffer(token.begin(), token.end());
        std::stringstream stream(buffer);
        double            value = 0.0;
        stream >> value;
        if (stream.fail() || !stream.eof() || !std::isfinite(value)) {
            return stored + " expects a floating-point value";
        }
        return handler ? handler(value) : std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void OptionParser::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        std::string message = "missing option for alias '";
        message.append(target.begin(), target.end());
        message.push_back('\'');
        log_error(message);
        mark_error();
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool OptionParser::parse(int argc, char const* const* argv) {
    had_error_ = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view                raw_token{argv[i]};
        std::optional<std::string_view> attached_value;
        std::string_view                name = raw_token;
        if (auto equals_pos = raw_token.find('='); equals_pos != std::string_view::npos) {
            name           = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            if (unknown_handler_ && !unknown_handler_(raw_token)) {
                mark_error();
            }
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                mark_error();
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        auto value = attached_value;
        if (!value) {
            if ((i + 1) >= argc) {
                log_error(entry->name + " requires a value");
                mark_error();
                continue;
            }
            ++i;
            value = std::string_view{argv[i]};
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(*value)) {
                log_error(*error);
                mark_error();
            }
        }
    }
    return !had_error_;
}

bool OptionParser::had_errors() const {
    return had_error_;
}

auto OptionParser::usage() const -> std::string {
    std::ostringstream out;
    out << "usage: " << (program_name_.empty() ? "combopanel" : program_name_) << " [options]\n";
    for (auto const& option : options_) {
        std::string line = "  " + option.name;
        if (option.expects_value) {
            line += " " + option.value_name;
        }
        out << line;
        if (!option.help.empty()) {
            out << std::string(line.size() < 28 ? 28 - line.size() : 1, ' ') << option.help;
        }
        out << '\n';
    }
    return out.str();
}

OptionParser::OptionEntry* OptionParser::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void OptionParser::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.emplace(options_.back().name, index);
}

void OptionParser::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string("combopanel") : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

void OptionParser::mark_error() {
    had_error_ = true;
}

} // namespace CP::Cli
