#include "cli/HeaderRenderer.hpp"

#include <cctype>
#include <sstream>
#include <vector>

#include "util/StringUtils.hpp"

namespace gitcontext {

namespace {

std::string optionalLiteral(const std::optional<std::string>& value) {
    return value ? StringUtils::toCppLiteral(*value) : "std::nullopt";
}

void writeOptionalString(std::ostream& out, const char* name, const std::optional<std::string>& value) {
    out << "inline constexpr std::optional<std::string_view> " << name << "{" << optionalLiteral(value) << "};\n";
}

void writeList(std::ostream& out, const char* name, const std::vector<std::string>& values) {
    out << "inline constexpr std::array<std::string_view, " << values.size() << "> " << name << "{";
    if (!values.empty()) {
        out << "{";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) out << ", ";
            out << StringUtils::toCppLiteral(values[i]);
        }
        out << "}";
    }
    out << "};\n";
}

bool isIdentifier(const std::string& part) {
    if (part.empty()) return false;
    if (std::isdigit(static_cast<unsigned char>(part[0]))) return false;
    for (char c : part) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

}

bool isValidNamespace(const std::string& ns) {
    size_t start = 0;
    while (true) {
        size_t sep = ns.find("::", start);
        std::string part = ns.substr(start, sep == std::string::npos ? std::string::npos : sep - start);
        if (!isIdentifier(part)) return false;
        if (sep == std::string::npos) return true;
        start = sep + 2;
    }
}

std::string renderHeader(const GitSnapshot& snapshot, const std::string& ns) {
    std::ostringstream out;
    out << "#pragma once\n\n"
        << "// This file was generated by gitcontext. Do not edit.\n\n"
        << "#include <array>\n"
        << "#include <cstdint>\n"
        << "#include <optional>\n"
        << "#include <string_view>\n\n"
        << "namespace " << ns << " {\n\n"
        << "// clang-format off\n";

    writeOptionalString(out, "hash", snapshot.hash);
    writeOptionalString(out, "branch", snapshot.branch);
    out << "inline constexpr bool is_detached = " << (snapshot.isDetached ? "true" : "false") << ";\n";
    writeOptionalString(out, "author", snapshot.author);

    if (snapshot.date) {
        out << "inline constexpr std::optional<std::int64_t> date_epoch_seconds{"
            << snapshot.date->epochSeconds << "};\n";
        out << "inline constexpr std::optional<int> date_offset_minutes{" << snapshot.date->offsetMinutes << "};\n";
        writeOptionalString(out, "date_iso8601", snapshot.date->toIso8601());
    } else {
        out << "inline constexpr std::optional<std::int64_t> date_epoch_seconds{std::nullopt};\n";
        out << "inline constexpr std::optional<int> date_offset_minutes{std::nullopt};\n";
        writeOptionalString(out, "date_iso8601", std::nullopt);
    }

    writeOptionalString(out, "message", snapshot.message);
    writeList(out, "parents", snapshot.parents);
    writeList(out, "tags", snapshot.tags);

    out << "// clang-format on\n\n"
        << "}  // namespace " << ns << "\n";
    return out.str();
}

}
