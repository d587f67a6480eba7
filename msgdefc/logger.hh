#pragma once

#include <iostream>
#include <string>

#include <msgdef/model.hh>

namespace msgdef::driver {

enum class LogLevel {
    Quiet,   // Errors and diagnostics only
    Normal,  // + warnings, progress, success
    Verbose, // + pipeline stages
    Debug    // + per-file traces
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * Console output of msgdefc.
 *
 * Diagnostics are printed compiler style, "file:line:column: error: text [E001]",
 * with the severity colored by termcolor. Diagnostics and errors go to stderr,
 * progress to stdout.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto);

    void error(const std::string& message);
    void warning(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// One model diagnostic, followed by its related note and suggestion
    void diagnostic(const semantic::diagnostic& diag);

    /// "N errors generated." when count is not zero
    void error_summary(std::size_t count);

    /// Indented list entry
    void item(const std::string& message);

private:
    LogLevel level_;

    bool should_log(LogLevel required_level) const;
    void severity(semantic::diagnostic_level level);
    static void position(const ast::source_pos& pos);
};

} // namespace msgdef::driver
