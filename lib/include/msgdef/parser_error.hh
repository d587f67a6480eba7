//
// Created by igor on 27/11/2025.
//

#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace msgdef {
    class parse_error : public std::runtime_error {
        public:
            parse_error(const std::string& msg, std::string file, int line, int column)
                : std::runtime_error(msg), file_(std::move(file)), line_(line), column_(column) {
            }

            [[nodiscard]] const std::string& file() const { return file_; }
            [[nodiscard]] int line() const { return line_; }
            [[nodiscard]] int column() const { return column_; }

        private:
            std::string file_;
            int line_;
            int column_;
    };

    // Module loading exception types
    class module_load_error : public std::runtime_error {
    public:
        explicit module_load_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    class circular_import_error : public module_load_error {
    public:
        explicit circular_import_error(const std::vector<std::string>& files)
            : module_load_error(build_message(files)),
              files_(files) {}

        /// Files of the cycle in import order; the first file is repeated at the end
        const std::vector<std::string>& files() const { return files_; }

    private:
        std::vector<std::string> files_;

        static std::string build_message(const std::vector<std::string>& files);
    };

    class import_not_found_error : public module_load_error {
    public:
        import_not_found_error(const std::string& import_name,
                              const std::string& importing_file,
                              const std::vector<std::string>& searched_paths)
            : module_load_error(build_message(import_name, importing_file, searched_paths)),
              import_name_(import_name),
              importing_file_(importing_file),
              searched_paths_(searched_paths) {}

        const std::string& import_name() const { return import_name_; }
        const std::string& importing_file() const { return importing_file_; }
        const std::vector<std::string>& searched_paths() const { return searched_paths_; }

    private:
        std::string import_name_;
        std::string importing_file_;
        std::vector<std::string> searched_paths_;

        static std::string build_message(const std::string& name,
                                         const std::string& importing_file,
                                         const std::vector<std::string>& paths);
    };

    // A transform pass was run on a model that does not satisfy its precondition
    class pipeline_error : public std::logic_error {
    public:
        explicit pipeline_error(const std::string& msg)
            : std::logic_error(msg) {}
    };
}
