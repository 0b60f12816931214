#include "modlint/types.hpp"

#include <sstream>
#include <tuple>

namespace modlint {

    bool diagnostic_less(const Diagnostic& a, const Diagnostic& b) {
        const auto span_key = [](const Diagnostic& d) {
            using Key = std::tuple<int, std::uint32_t, std::uint32_t>;
            return d.span ? Key{1, d.span->start, d.span->end} : Key{0, 0, 0};
        };
        const auto segment_key = [](const Diagnostic& d) {
            return d.segment ? *d.segment + 1 : std::size_t{0};
        };

        return std::forward_as_tuple(a.path.native(), segment_key(a), span_key(a), a.code, a.message) <
               std::forward_as_tuple(b.path.native(), segment_key(b), span_key(b), b.code, b.message);
    }

    std::string format_diagnostic(const Diagnostic& diagnostic) {
        std::ostringstream ss;
        ss << diagnostic.path.string();
        if (diagnostic.span) {
            ss << ":" << diagnostic.span->start << "-" << diagnostic.span->end;
        }
        if (diagnostic.segment) {
            ss << " (segment " << *diagnostic.segment << ")";
        }
        ss << ": " << to_string(diagnostic.severity)
           << "[" << diagnostic.code << "]: " << diagnostic.message;
        if (diagnostic.help) {
            ss << " (help: " << *diagnostic.help << ")";
        }
        return ss.str();
    }

    std::optional<SourceType> source_type_from_extension(const std::string_view extension) {
        if (extension == ".js" || extension == ".mjs" || extension == ".cjs" || extension == ".jsx") {
            return SourceType{Language::JavaScript, true};
        }
        if (extension == ".ts" || extension == ".mts" || extension == ".cts") {
            return SourceType{Language::TypeScript, false};
        }
        if (extension == ".tsx") {
            return SourceType{Language::TypeScript, true};
        }
        return std::nullopt;
    }

}  // namespace modlint
