//
// Diagnostic formatting and model lookups
//

#include <msgdef/model.hh>
#include <algorithm>
#include <iterator>
#include <ostream>
#include <sstream>

namespace msgdef::semantic {

// ============================================================================
// Diagnostic Formatting
// ============================================================================

std::string diagnostic::format() const {
    std::ostringstream oss;

    // Format: file:line:column: level: message [code]
    oss << position.file << ":"
        << position.line << ":"
        << position.column << ": ";

    switch (level) {
        case diagnostic_level::error:
            oss << "error: ";
            break;
        case diagnostic_level::warning:
            oss << "warning: ";
            break;
        case diagnostic_level::note:
            oss << "note: ";
            break;
        case diagnostic_level::hint:
            oss << "hint: ";
            break;
    }

    oss << message;

    if (!code.empty()) {
        oss << " [" << code << "]";
    }

    oss << "\n";

    if (related_position && related_message) {
        oss << related_position->file << ":"
            << related_position->line << ":"
            << related_position->column << ": note: "
            << related_message.value() << "\n";
    }

    if (suggestion) {
        oss << "  suggestion: " << suggestion.value() << "\n";
    }

    return oss.str();
}

// ============================================================================
// Build Result Methods
// ============================================================================

bool build_result::has_errors() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
}

size_t build_result::error_count() const {
    return std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
}

std::vector<diagnostic> build_result::get_errors() const {
    std::vector<diagnostic> result;
    std::copy_if(diagnostics.begin(), diagnostics.end(),
                std::back_inserter(result),
                [](const auto& d) { return d.level == diagnostic_level::error; });
    return result;
}

void build_result::print_diagnostics(std::ostream& os) const {
    for (const auto& diag : diagnostics) {
        os << diag.format();
    }

    size_t errors = error_count();
    if (errors > 0) {
        os << "\n" << errors << " error" << (errors != 1 ? "s" : "") << " generated.\n";
    }
}

// ============================================================================
// Model Lookups
// ============================================================================

const entity_ref* model::find(const std::string& qfn) const {
    auto it = symbols.find(qfn);
    return it != symbols.end() ? &it->second : nullptr;
}

const message* model::find_message(const std::string& qfn) const {
    const auto* ref = find(qfn);
    return (ref && ref->kind == entity_kind::message) ? &messages[ref->index] : nullptr;
}

const enumeration* model::find_enum(const std::string& qfn) const {
    const auto* ref = find(qfn);
    return (ref && ref->kind == entity_kind::enum_) ? &enums[ref->index] : nullptr;
}

const namespace_node* model::find_namespace(const std::string& qfn) const {
    auto it = std::find_if(namespaces.begin(), namespaces.end(),
        [&qfn](const auto& ns) { return ns.qfn == qfn; });
    return it != namespaces.end() ? &*it : nullptr;
}

const enum_value* enumeration::find_value(const std::string& value_name) const {
    auto it = std::find_if(values.begin(), values.end(),
        [&value_name](const auto& v) { return v.name == value_name; });
    return it != values.end() ? &*it : nullptr;
}

unsigned enum_bit_width(const std::vector<std::int64_t>& values, bool is_open) {
    std::uint64_t max_magnitude = 0;
    for (auto v : values) {
        const std::uint64_t magnitude = v < 0
            ? std::uint64_t{0} - static_cast<std::uint64_t>(v)
            : static_cast<std::uint64_t>(v);
        max_magnitude = std::max(max_magnitude, magnitude);
    }

    if (is_open) {
        return max_magnitude > 0xFFFFFFFFull ? 64 : 32;
    }
    if (max_magnitude <= 0xFFull) return 8;
    if (max_magnitude <= 0xFFFFull) return 16;
    if (max_magnitude <= 0xFFFFFFFFull) return 32;
    return 64;
}

const char* type_kind_name(type_kind kind) {
    switch (kind) {
        case type_kind::string_: return "string";
        case type_kind::int_: return "int";
        case type_kind::float_: return "float";
        case type_kind::bool_: return "bool";
        case type_kind::byte_: return "byte";
        case type_kind::enum_ref: return "enum";
        case type_kind::options_ref: return "options";
        case type_kind::message_ref: return "message";
        case type_kind::compound: return "compound";
        case type_kind::array: return "array";
        case type_kind::map: return "map";
    }
    return "unknown";
}

} // namespace msgdef::semantic
