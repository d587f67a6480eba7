#include "logger.hh"
#include <termcolor/termcolor.hpp>

namespace msgdef::driver {

Logger::Logger(LogLevel level, ColorMode color)
    : level_(level)
{
    switch (color) {
        case ColorMode::Always:
            std::cout << termcolor::colorize;
            std::cerr << termcolor::colorize;
            break;
        case ColorMode::Never:
            std::cout << termcolor::nocolorize;
            std::cerr << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            // termcolor only colors terminals
            break;
    }
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    std::cerr << termcolor::bold << termcolor::red
              << "error: " << termcolor::reset
              << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cerr << termcolor::bold << termcolor::yellow
              << "warning: " << termcolor::reset
              << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cout << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cout << termcolor::bold << termcolor::green
              << "ok: " << termcolor::reset
              << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    std::cout << termcolor::cyan
              << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    std::cout << termcolor::magenta
              << "[debug] " << termcolor::reset
              << message << "\n";
}

void Logger::position(const ast::source_pos& pos) {
    std::cerr << termcolor::bold
              << pos.file << ":" << pos.line << ":" << pos.column << ": "
              << termcolor::reset;
}

void Logger::severity(semantic::diagnostic_level level) {
    switch (level) {
        case semantic::diagnostic_level::error:
            std::cerr << termcolor::bold << termcolor::red << "error: ";
            break;
        case semantic::diagnostic_level::warning:
            std::cerr << termcolor::bold << termcolor::yellow << "warning: ";
            break;
        case semantic::diagnostic_level::note:
            std::cerr << termcolor::bold << termcolor::cyan << "note: ";
            break;
        case semantic::diagnostic_level::hint:
            std::cerr << termcolor::bold << termcolor::green << "hint: ";
            break;
    }
    std::cerr << termcolor::reset;
}

void Logger::diagnostic(const semantic::diagnostic& diag) {
    // Warnings and below follow the log level, errors are always shown
    if (diag.level != semantic::diagnostic_level::error && !should_log(LogLevel::Normal)) {
        return;
    }

    position(diag.position);
    severity(diag.level);
    std::cerr << diag.message;
    if (!diag.code.empty()) {
        std::cerr << termcolor::grey << " [" << diag.code << "]" << termcolor::reset;
    }
    std::cerr << "\n";

    if (diag.related_position && diag.related_message) {
        position(*diag.related_position);
        severity(semantic::diagnostic_level::note);
        std::cerr << *diag.related_message << "\n";
    }
    if (diag.suggestion) {
        std::cerr << "  " << termcolor::green << *diag.suggestion << termcolor::reset << "\n";
    }
}

void Logger::error_summary(std::size_t count) {
    if (count == 0) return;

    std::cerr << "\n" << termcolor::bold
              << count << " error" << (count != 1 ? "s" : "") << " generated."
              << termcolor::reset << "\n";
}

void Logger::item(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cout << "  - " << message << "\n";
}

} // namespace msgdef::driver
