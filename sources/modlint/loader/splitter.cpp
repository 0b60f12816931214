#include "modlint/loader/splitter.hpp"

#include <cctype>
#include <optional>
#include <string>

namespace modlint::loader {

    namespace {

        bool iequals_at(const std::string_view text, const std::size_t pos, const std::string_view word) {
            if (pos + word.size() > text.size()) {
                return false;
            }
            for (std::size_t i = 0; i < word.size(); ++i) {
                const auto a = static_cast<unsigned char>(text[pos + i]);
                if (std::tolower(a) != static_cast<unsigned char>(word[i])) {
                    return false;
                }
            }
            return true;
        }

        std::size_t ifind(const std::string_view text, const std::string_view word, std::size_t from) {
            for (; from + word.size() <= text.size(); ++from) {
                if (iequals_at(text, from, word)) {
                    return from;
                }
            }
            return std::string_view::npos;
        }

        Diagnostic split_error(const std::uint32_t start, const std::uint32_t end, std::string message) {
            Diagnostic d;
            d.span = Span{start, end};
            d.severity = Severity::Error;
            d.code = std::string(codes::parse);
            d.message = std::move(message);
            return d;
        }

        struct OpenTag {
            std::size_t end = 0;          // one past '>'
            bool self_closing = false;
            std::optional<std::string> lang;
        };

        /**
         * Parses the attributes of a <script ...> tag starting after "<script".
         */
        std::optional<OpenTag> parse_open_tag(const std::string_view text, std::size_t pos) {
            OpenTag tag;
            while (pos < text.size()) {
                const char c = text[pos];
                if (c == '>') {
                    tag.self_closing = pos > 0 && text[pos - 1] == '/';
                    tag.end = pos + 1;
                    return tag;
                }
                if (std::isspace(static_cast<unsigned char>(c)) || c == '/') {
                    ++pos;
                    continue;
                }

                const std::size_t name_start = pos;
                while (pos < text.size() && text[pos] != '=' && text[pos] != '>' &&
                       !std::isspace(static_cast<unsigned char>(text[pos]))) {
                    ++pos;
                }
                const std::string_view name = text.substr(name_start, pos - name_start);

                std::string_view value;
                if (pos < text.size() && text[pos] == '=') {
                    ++pos;
                    if (pos < text.size() && (text[pos] == '"' || text[pos] == '\'')) {
                        const char quote = text[pos++];
                        const std::size_t value_start = pos;
                        while (pos < text.size() && text[pos] != quote) {
                            ++pos;
                        }
                        if (pos >= text.size()) {
                            return std::nullopt;
                        }
                        value = text.substr(value_start, pos - value_start);
                        ++pos;
                    } else {
                        const std::size_t value_start = pos;
                        while (pos < text.size() && text[pos] != '>' &&
                               !std::isspace(static_cast<unsigned char>(text[pos]))) {
                            ++pos;
                        }
                        value = text.substr(value_start, pos - value_start);
                    }
                }

                if (name == "lang") {
                    tag.lang = std::string(value);
                }
            }
            return std::nullopt;
        }

        SourceType source_type_for_lang(const std::optional<std::string>& lang) {
            SourceType type;
            if (!lang) {
                return type;
            }
            if (*lang == "ts") {
                type.language = Language::TypeScript;
            } else if (*lang == "tsx") {
                type.language = Language::TypeScript;
                type.jsx = true;
            } else if (*lang == "jsx") {
                type.jsx = true;
            }
            return type;
        }

    }  // namespace

    // ============================================================================
    // PlainSplitter
    // ============================================================================

    Result<std::vector<Segment>, Diagnostics> PlainSplitter::split(
        const std::string_view text,
        const std::string_view extension
    ) const {
        const auto type = source_type_from_extension(extension);
        if (!type) {
            return Result<std::vector<Segment>, Diagnostics>::failure(Diagnostics{
                split_error(0, 0, "Unsupported script extension '" + std::string(extension) + "'")
            });
        }

        std::vector<Segment> segments;
        segments.push_back(Segment{text, 0, *type});
        return Result<std::vector<Segment>, Diagnostics>::success(std::move(segments));
    }

    // ============================================================================
    // CompositeSplitter
    // ============================================================================

    Result<std::vector<Segment>, Diagnostics> CompositeSplitter::split(
        const std::string_view text,
        std::string_view /*extension*/
    ) const {
        std::vector<Segment> segments;
        std::size_t pos = 0;

        while (pos < text.size()) {
            const std::size_t comment = text.find("<!--", pos);
            const std::size_t tag = ifind(text, "<script", pos);
            if (tag == std::string_view::npos) {
                break;
            }

            if (comment != std::string_view::npos && comment < tag) {
                const std::size_t comment_end = text.find("-->", comment + 4);
                if (comment_end == std::string_view::npos) {
                    break;
                }
                pos = comment_end + 3;
                continue;
            }

            const std::size_t after_name = tag + 7;
            if (after_name < text.size() && text[after_name] != '>' && text[after_name] != '/' &&
                !std::isspace(static_cast<unsigned char>(text[after_name]))) {
                // <scripts>, <script-setup> and the like
                pos = after_name;
                continue;
            }

            const auto open = parse_open_tag(text, after_name);
            if (!open) {
                return Result<std::vector<Segment>, Diagnostics>::failure(Diagnostics{
                    split_error(static_cast<std::uint32_t>(tag), static_cast<std::uint32_t>(text.size()),
                                "Unterminated <script> tag")
                });
            }

            if (open->self_closing) {
                pos = open->end;
                continue;
            }

            const std::size_t close = ifind(text, "</script", open->end);
            if (close == std::string_view::npos) {
                return Result<std::vector<Segment>, Diagnostics>::failure(Diagnostics{
                    split_error(static_cast<std::uint32_t>(tag), static_cast<std::uint32_t>(open->end),
                                "Unterminated <script> block")
                });
            }

            segments.push_back(Segment{
                text.substr(open->end, close - open->end),
                static_cast<std::uint32_t>(open->end),
                source_type_for_lang(open->lang)
            });

            const std::size_t close_end = text.find('>', close);
            pos = close_end == std::string_view::npos ? text.size() : close_end + 1;
        }

        return Result<std::vector<Segment>, Diagnostics>::success(std::move(segments));
    }

}  // namespace modlint::loader
