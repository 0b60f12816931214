#include "modlint/loader/parser.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace modlint::loader {

    const char* to_string(const NodeKind kind) noexcept {
        switch (kind) {
            case NodeKind::ImportDeclaration:   return "ImportDeclaration";
            case NodeKind::ExportDeclaration:   return "ExportDeclaration";
            case NodeKind::DebuggerStatement:   return "DebuggerStatement";
            case NodeKind::VariableDeclaration: return "VariableDeclaration";
            case NodeKind::FunctionDeclaration: return "FunctionDeclaration";
            case NodeKind::ClassDeclaration:    return "ClassDeclaration";
            case NodeKind::ExpressionStatement: return "ExpressionStatement";
        }
        return "Unknown";
    }

    namespace {

        constexpr std::size_t npos = static_cast<std::size_t>(-1);

        // ============================================================================
        // Tokens
        // ============================================================================

        enum class TokenKind {
            Identifier,
            String,
            Template,
            Number,
            Regex,
            Punct
        };

        struct Token {
            TokenKind kind = TokenKind::Punct;
            std::string_view text;
            std::string_view value;   // string literal contents
            Span span;
            bool newline_before = false;
        };

        struct LexError {
            std::string message;
            Span span;
        };

        const std::unordered_set<std::string_view>& reserved_words() {
            static const std::unordered_set<std::string_view> words = {
                "abstract", "as", "async", "await", "break", "case", "catch", "class", "const",
                "continue", "debugger", "declare", "default", "delete", "do", "else", "enum",
                "export", "extends", "false", "finally", "for", "from", "function", "get", "if",
                "implements", "import", "in", "infer", "instanceof", "interface", "is", "keyof",
                "let", "namespace", "new", "null", "of", "private", "protected", "public",
                "readonly", "return", "satisfies", "set", "static", "super", "switch", "this",
                "throw", "true", "try", "type", "typeof", "var", "void", "while", "with", "yield"
            };
            return words;
        }

        // Keywords after which an expression operand is expected.
        bool expects_operand(const std::string_view word) {
            return word == "return" || word == "typeof" || word == "instanceof" || word == "in" ||
                   word == "of" || word == "new" || word == "delete" || word == "void" ||
                   word == "throw" || word == "case" || word == "do" || word == "else" ||
                   word == "yield" || word == "await" || word == "extends";
        }

        // Words that continue the previous line rather than start a statement.
        bool continues_line(const std::string_view word) {
            return word == "in" || word == "of" || word == "instanceof" || word == "as" ||
                   word == "satisfies" || word == "extends" || word == "implements" ||
                   word == "else" || word == "catch" || word == "finally" || word == "while";
        }

        bool is_ident_start(const char c) {
            const auto u = static_cast<unsigned char>(c);
            return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || u == '_' || u == '$' ||
                   u == '#' || u >= 0x80;
        }

        bool is_ident_part(const char c) {
            const auto u = static_cast<unsigned char>(c);
            return is_ident_start(c) || (u >= '0' && u <= '9');
        }

        bool is_digit(const char c) {
            return c >= '0' && c <= '9';
        }

        // ============================================================================
        // Lexer
        // ============================================================================

        class Lexer {
        public:
            Lexer(const std::string_view text, const bool jsx, std::pmr::vector<Token>& out)
                : text_(text), jsx_(jsx), tokens_(out) {}

            std::optional<LexError> run() {
                bool newline = false;

                if (text_.starts_with("#!")) {
                    pos_ = text_.find('\n');
                    if (pos_ == std::string_view::npos) {
                        return std::nullopt;
                    }
                }

                while (pos_ < text_.size()) {
                    const char c = text_[pos_];

                    if (c == '\n') {
                        newline = true;
                        ++pos_;
                        continue;
                    }
                    if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
                        ++pos_;
                        continue;
                    }
                    if (c == '/' && peek(1) == '/') {
                        const std::size_t eol = text_.find('\n', pos_);
                        pos_ = eol == std::string_view::npos ? text_.size() : eol;
                        continue;
                    }
                    if (c == '/' && peek(1) == '*') {
                        const std::size_t end = text_.find("*/", pos_ + 2);
                        if (end == std::string_view::npos) {
                            return error("Unterminated comment", pos_, text_.size());
                        }
                        if (text_.substr(pos_, end - pos_).find('\n') != std::string_view::npos) {
                            newline = true;
                        }
                        pos_ = end + 2;
                        continue;
                    }

                    const std::size_t start = pos_;
                    std::optional<LexError> err;

                    if (c == '"' || c == '\'') {
                        err = lex_string(c);
                    } else if (c == '`') {
                        ++pos_;
                        err = lex_template(start);
                    } else if (c == '}' && !braces_.empty() && braces_.back() == 'T') {
                        braces_.pop_back();
                        template_starts_.pop_back();
                        ++pos_;
                        err = lex_template(start);
                    } else if (is_ident_start(c)) {
                        while (pos_ < text_.size() && is_ident_part(text_[pos_])) {
                            ++pos_;
                        }
                        push(TokenKind::Identifier, start);
                    } else if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
                        lex_number();
                        push(TokenKind::Number, start);
                    } else if (c == '/' && regex_allowed()) {
                        err = lex_regex();
                    } else if (c == '.' && peek(1) == '.' && peek(2) == '.') {
                        pos_ += 3;
                        push(TokenKind::Punct, start);
                    } else {
                        if (c == '{') {
                            braces_.push_back('{');
                        } else if (c == '}' && !braces_.empty()) {
                            braces_.pop_back();
                        }
                        ++pos_;
                        push(TokenKind::Punct, start);
                    }

                    if (err) {
                        return err;
                    }

                    tokens_.back().newline_before = newline;
                    newline = false;
                }

                for (auto it = braces_.rbegin(); it != braces_.rend(); ++it) {
                    if (*it == 'T') {
                        return error("Unterminated template literal", template_starts_.back(), text_.size());
                    }
                }

                return std::nullopt;
            }

        private:
            [[nodiscard]] char peek(const std::size_t ahead) const {
                return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
            }

            void push(const TokenKind kind, const std::size_t start, std::string_view value = {}) {
                Token token;
                token.kind = kind;
                token.text = text_.substr(start, pos_ - start);
                token.value = value;
                token.span = Span{static_cast<std::uint32_t>(start), static_cast<std::uint32_t>(pos_)};
                tokens_.push_back(token);
            }

            [[nodiscard]] static std::optional<LexError> error(
                std::string message,
                const std::size_t start,
                const std::size_t end
            ) {
                return LexError{
                    std::move(message),
                    Span{static_cast<std::uint32_t>(start), static_cast<std::uint32_t>(end)}
                };
            }

            [[nodiscard]] bool regex_allowed() const {
                if (tokens_.empty()) {
                    return true;
                }
                const Token& last = tokens_.back();
                switch (last.kind) {
                    case TokenKind::Punct:
                        if (jsx_ && last.text == "<") {
                            return false;
                        }
                        return last.text != ")" && last.text != "]" && last.text != "}";
                    case TokenKind::Identifier:
                        return expects_operand(last.text);
                    case TokenKind::Template:
                        return last.text.ends_with("${");
                    default:
                        return false;
                }
            }

            std::optional<LexError> lex_string(const char quote) {
                const std::size_t start = pos_++;
                while (pos_ < text_.size()) {
                    const char c = text_[pos_];
                    if (c == '\\') {
                        pos_ += 2;
                        continue;
                    }
                    if (c == '\n') {
                        break;
                    }
                    if (c == quote) {
                        ++pos_;
                        push(TokenKind::String, start, text_.substr(start + 1, pos_ - start - 2));
                        return std::nullopt;
                    }
                    ++pos_;
                }
                return error("Unterminated string literal", start, std::min(pos_, text_.size()));
            }

            std::optional<LexError> lex_template(const std::size_t start) {
                while (pos_ < text_.size()) {
                    const char c = text_[pos_];
                    if (c == '\\') {
                        pos_ += 2;
                        continue;
                    }
                    if (c == '`') {
                        ++pos_;
                        push(TokenKind::Template, start);
                        return std::nullopt;
                    }
                    if (c == '$' && peek(1) == '{') {
                        pos_ += 2;
                        braces_.push_back('T');
                        template_starts_.push_back(start);
                        push(TokenKind::Template, start);
                        return std::nullopt;
                    }
                    ++pos_;
                }
                return error("Unterminated template literal", start, text_.size());
            }

            void lex_number() {
                const bool hex = text_[pos_] == '0' && (peek(1) == 'x' || peek(1) == 'X');
                while (pos_ < text_.size()) {
                    const char c = text_[pos_];
                    if (is_ident_part(c) || c == '.') {
                        ++pos_;
                        continue;
                    }
                    if (!hex && (c == '+' || c == '-') && pos_ > 0 &&
                        (text_[pos_ - 1] == 'e' || text_[pos_ - 1] == 'E')) {
                        ++pos_;
                        continue;
                    }
                    break;
                }
            }

            std::optional<LexError> lex_regex() {
                const std::size_t start = pos_++;
                bool in_class = false;
                while (pos_ < text_.size()) {
                    const char c = text_[pos_];
                    if (c == '\\') {
                        pos_ += 2;
                        continue;
                    }
                    if (c == '\n') {
                        break;
                    }
                    if (c == '[') {
                        in_class = true;
                    } else if (c == ']') {
                        in_class = false;
                    } else if (c == '/' && !in_class) {
                        ++pos_;
                        while (pos_ < text_.size() && is_ident_part(text_[pos_])) {
                            ++pos_;
                        }
                        push(TokenKind::Regex, start);
                        return std::nullopt;
                    }
                    ++pos_;
                }
                return error("Unterminated regular expression", start, std::min(pos_, text_.size()));
            }

            std::string_view text_;
            bool jsx_;
            std::pmr::vector<Token>& tokens_;
            std::size_t pos_ = 0;
            std::vector<char> braces_;
            std::vector<std::size_t> template_starts_;
        };

        // ============================================================================
        // Statement parser
        // ============================================================================

        class StatementParser {
        public:
            StatementParser(
                memory::Arena& arena,
                const Segment& segment,
                const std::pmr::vector<Token>& tokens,
                StructuralTree& tree
            )
                : arena_(arena)
                , segment_(segment)
                , tokens_(tokens)
                , tree_(tree)
                , match_(tokens.size(), npos, &arena) {}

            std::optional<Diagnostic> run() {
                if (!match_brackets()) {
                    return error_;
                }

                std::size_t i = 0;
                while (i < tokens_.size() && !error_) {
                    if (is(i, ";")) {
                        ++i;
                        continue;
                    }
                    i = parse_statement(i);
                }
                return error_;
            }

        private:
            struct DeclarationEnd {
                NodeKind kind;
                std::size_t end;
            };

            // ---------------------------------------------------------------- helpers

            [[nodiscard]] bool is(const std::size_t i, const std::string_view text) const {
                return i < tokens_.size() &&
                       (tokens_[i].kind == TokenKind::Punct || tokens_[i].kind == TokenKind::Identifier) &&
                       tokens_[i].text == text;
            }

            [[nodiscard]] bool is_ident(const std::size_t i) const {
                return i < tokens_.size() && tokens_[i].kind == TokenKind::Identifier;
            }

            [[nodiscard]] bool is_binding_ident(const std::size_t i) const {
                return is_ident(i) && !reserved_words().contains(tokens_[i].text);
            }

            [[nodiscard]] bool is_string(const std::size_t i) const {
                return i < tokens_.size() && tokens_[i].kind == TokenKind::String;
            }

            [[nodiscard]] bool is_open(const std::size_t i) const {
                return is(i, "(") || is(i, "[") || is(i, "{");
            }

            [[nodiscard]] bool is_close(const std::size_t i) const {
                return is(i, ")") || is(i, "]") || is(i, "}");
            }

            [[nodiscard]] Identifier ident_at(const std::size_t i) const {
                return Identifier{tokens_[i].text, tokens_[i].span};
            }

            [[nodiscard]] Span span_of(const std::size_t start, const std::size_t end) const {
                if (end <= start) {
                    return tokens_[start].span;
                }
                return Span{tokens_[start].span.start, tokens_[end - 1].span.end};
            }

            void fail(std::string message, const Span span) {
                if (error_) {
                    return;
                }
                Diagnostic d;
                d.span = span.shifted(segment_.offset);
                d.severity = Severity::Error;
                d.code = std::string(codes::parse);
                d.message = std::move(message);
                error_ = std::move(d);
            }

            Node* new_node(const NodeKind kind) {
                Node* node = arena_.make<Node>(kind, &arena_);
                tree_.body.push_back(node);
                return node;
            }

            // --------------------------------------------------------------- brackets

            bool match_brackets() {
                std::pmr::vector<std::size_t> stack(&arena_);
                for (std::size_t i = 0; i < tokens_.size(); ++i) {
                    if (is_open(i)) {
                        stack.push_back(i);
                        continue;
                    }
                    if (!is_close(i)) {
                        continue;
                    }
                    if (stack.empty()) {
                        fail("Unexpected '" + std::string(tokens_[i].text) + "'", tokens_[i].span);
                        return false;
                    }
                    const std::size_t open = stack.back();
                    const char o = tokens_[open].text[0];
                    const char c = tokens_[i].text[0];
                    const char expected = o == '(' ? ')' : o == '[' ? ']' : '}';
                    if (c != expected) {
                        fail(std::string("Mismatched '") + c + "', expected '" + expected + "'", tokens_[i].span);
                        return false;
                    }
                    match_[open] = i;
                    match_[i] = open;
                    stack.pop_back();
                }
                if (!stack.empty()) {
                    const std::size_t open = stack.back();
                    fail("Unclosed '" + std::string(tokens_[open].text) + "'", tokens_[open].span);
                    return false;
                }
                return true;
            }

            // ------------------------------------------------------------ boundaries

            [[nodiscard]] bool ends_expression(const Token& token) const {
                switch (token.kind) {
                    case TokenKind::Punct:
                        return token.text == ")" || token.text == "]" || token.text == "}";
                    case TokenKind::Identifier:
                        return !expects_operand(token.text) && token.text != "export" &&
                               token.text != "import" && token.text != "const" && token.text != "let" &&
                               token.text != "var" && token.text != "function" && token.text != "class" &&
                               token.text != "async";
                    case TokenKind::Template:
                        return !token.text.ends_with("${");
                    default:
                        return true;
                }
            }

            [[nodiscard]] bool starts_statement(const Token& token) const {
                switch (token.kind) {
                    case TokenKind::Identifier:
                        return !continues_line(token.text);
                    case TokenKind::Number:
                    case TokenKind::String:
                        return true;
                    default:
                        return false;
                }
            }

            /**
             * Index one past the statement starting at start.
             */
            [[nodiscard]] std::size_t statement_end(const std::size_t start) const {
                std::size_t i = start;
                while (i < tokens_.size()) {
                    if (i > start && tokens_[i].newline_before &&
                        ends_expression(tokens_[i - 1]) && starts_statement(tokens_[i])) {
                        return i;
                    }
                    if (is_open(i)) {
                        i = match_[i] + 1;
                        continue;
                    }
                    if (is(i, ";")) {
                        return i + 1;
                    }
                    if (is_close(i)) {
                        return i;
                    }
                    ++i;
                }
                return tokens_.size();
            }

            // ------------------------------------------------------------ references

            [[nodiscard]] static bool is_declared(const Node& node, const Span span) {
                for (const auto& d : node.declared) {
                    if (d.span == span) {
                        return true;
                    }
                }
                return false;
            }

            void add_references(Node& node, const std::size_t from, const std::size_t to) {
                for (std::size_t i = from; i < to && i < tokens_.size(); ++i) {
                    const Token& t = tokens_[i];
                    if (t.kind != TokenKind::Identifier || t.text.starts_with("#")) {
                        continue;
                    }
                    if (reserved_words().contains(t.text)) {
                        continue;
                    }
                    if (i > 0 && is(i - 1, ".")) {
                        continue;
                    }
                    // object literal key
                    if (is(i + 1, ":") && i > 0 && (is(i - 1, "{") || is(i - 1, ","))) {
                        continue;
                    }
                    if (is_declared(node, t.span)) {
                        continue;
                    }
                    node.references.push_back(Identifier{t.text, t.span});
                }
            }

            /**
             * Lifts debugger statements nested inside [from, to) into the body.
             */
            void lift_debuggers(const std::size_t from, const std::size_t to) {
                for (std::size_t i = from; i < to && i < tokens_.size(); ++i) {
                    if (!is(i, "debugger") || (i > 0 && is(i - 1, "."))) {
                        continue;
                    }
                    Node* node = new_node(NodeKind::DebuggerStatement);
                    const std::size_t end = is(i + 1, ";") ? i + 2 : i + 1;
                    node->span = span_of(i, end);
                }
            }

            // ---------------------------------------------------------- declarations

            void collect_pattern(Node& node, const std::size_t open, const std::size_t close) {
                for (std::size_t k = open + 1; k < close; ++k) {
                    if (!is_binding_ident(k) || is(k - 1, ".") || is(k - 1, "=")) {
                        continue;
                    }
                    if (is(k + 1, ",") || is(k + 1, "}") || is(k + 1, "]") || is(k + 1, "=")) {
                        node.declared.push_back(ident_at(k));
                    }
                }
            }

            std::size_t parse_function(const std::size_t i, Node& node) {
                std::size_t j = i;
                if (is(j, "async")) {
                    ++j;
                }
                ++j;
                if (is(j, "*")) {
                    ++j;
                }
                if (is_binding_ident(j)) {
                    node.declared.push_back(ident_at(j));
                    ++j;
                }

                std::size_t end = tokens_.size();
                for (std::size_t k = j; k < tokens_.size();) {
                    if (is(k, "{")) {
                        end = match_[k] + 1;
                        break;
                    }
                    if (is_open(k)) {
                        k = match_[k] + 1;
                        continue;
                    }
                    if (is(k, ";")) {
                        end = k + 1;
                        break;
                    }
                    ++k;
                }

                add_references(node, j, end);
                return end;
            }

            std::size_t parse_class(const std::size_t i, Node& node) {
                std::size_t j = i;
                if (is(j, "abstract")) {
                    ++j;
                }
                ++j;
                if (is_binding_ident(j)) {
                    node.declared.push_back(ident_at(j));
                    ++j;
                }

                std::size_t end = tokens_.size();
                for (std::size_t k = j; k < tokens_.size();) {
                    if (is(k, "{") && !is(k - 1, "extends") && !is(k - 1, "implements") && !is(k - 1, ",")) {
                        end = match_[k] + 1;
                        break;
                    }
                    if (is_open(k)) {
                        k = match_[k] + 1;
                        continue;
                    }
                    ++k;
                }

                add_references(node, j, end);
                return end;
            }

            std::size_t parse_variable(const std::size_t i, Node& node) {
                const std::size_t end = statement_end(i);
                bool expect_binding = true;

                for (std::size_t k = i + 1; k < end;) {
                    if (expect_binding) {
                        if (is_binding_ident(k)) {
                            node.declared.push_back(ident_at(k));
                            expect_binding = false;
                            ++k;
                            continue;
                        }
                        if (is(k, "{") || is(k, "[")) {
                            collect_pattern(node, k, match_[k]);
                            expect_binding = false;
                            k = match_[k] + 1;
                            continue;
                        }
                    }
                    if (is_open(k)) {
                        k = match_[k] + 1;
                        continue;
                    }
                    if (is(k, ",")) {
                        expect_binding = true;
                    }
                    ++k;
                }

                add_references(node, i + 1, end);
                return end;
            }

            std::optional<DeclarationEnd> parse_declaration(const std::size_t i, Node& node) {
                if (is(i, "function") || (is(i, "async") && is(i + 1, "function") && !tokens_[i + 1].newline_before)) {
                    return DeclarationEnd{NodeKind::FunctionDeclaration, parse_function(i, node)};
                }
                if (is(i, "class") || (is(i, "abstract") && is(i + 1, "class"))) {
                    return DeclarationEnd{NodeKind::ClassDeclaration, parse_class(i, node)};
                }
                if (is(i, "var") || (is(i, "const") && !is(i + 1, "enum")) ||
                    (is(i, "let") && (is_binding_ident(i + 1) || is(i + 1, "{") || is(i + 1, "[")))) {
                    return DeclarationEnd{NodeKind::VariableDeclaration, parse_variable(i, node)};
                }
                return std::nullopt;
            }

            // ----------------------------------------------------- module statements

            /**
             * Skips "with { ... }" / "assert { ... }" and a trailing semicolon.
             */
            [[nodiscard]] std::size_t finish_module_statement(std::size_t j) const {
                if ((is(j, "with") || is(j, "assert")) && is(j + 1, "{") && !tokens_[j].newline_before) {
                    j = match_[j + 1] + 1;
                }
                if (is(j, ";")) {
                    ++j;
                }
                return j;
            }

            void set_source(Node& node, const std::size_t j) const {
                node.source = tokens_[j].value;
                node.source_span = tokens_[j].span;
                node.has_source = true;
            }

            /**
             * Parses "{ a, b as c, type d }" between open and its match.
             * Calls emit(name_index, alias_index or npos, type_only).
             */
            template<typename Emit>
            bool parse_specifiers(const std::size_t open, Emit&& emit) {
                const std::size_t close = match_[open];
                std::size_t k = open + 1;
                while (k < close) {
                    if (is(k, ",")) {
                        ++k;
                        continue;
                    }
                    bool type_only = false;
                    if (is(k, "type") && (is_ident(k + 1) || is_string(k + 1)) && !is(k + 1, "as")) {
                        type_only = true;
                        ++k;
                    }
                    if (!is_ident(k) && !is_string(k)) {
                        return false;
                    }
                    const std::size_t name = k++;
                    std::size_t alias = npos;
                    if (is(k, "as")) {
                        if (!is_ident(k + 1) && !is_string(k + 1)) {
                            return false;
                        }
                        alias = k + 1;
                        k += 2;
                    }
                    if (k < close && !is(k, ",")) {
                        return false;
                    }
                    emit(name, alias, type_only);
                }
                return true;
            }

            [[nodiscard]] std::string_view name_of(const std::size_t i) const {
                return tokens_[i].kind == TokenKind::String ? tokens_[i].value : tokens_[i].text;
            }

            std::size_t parse_import(const std::size_t i) {
                Node* node = new_node(NodeKind::ImportDeclaration);
                std::size_t j = i + 1;

                const auto malformed = [&] {
                    fail("Malformed import declaration", span_of(i, std::min(j + 1, tokens_.size())));
                    return tokens_.size();
                };

                if (is(j, "type") && ((is_ident(j + 1) && !is(j + 1, "from")) || is(j + 1, "{") || is(j + 1, "*"))) {
                    node->type_only = true;
                    ++j;
                }

                if (is_string(j)) {
                    set_source(*node, j);
                    const std::size_t end = finish_module_statement(j + 1);
                    node->span = span_of(i, end);
                    return end;
                }

                if (is_binding_ident(j)) {
                    if (is(j + 1, "=")) {
                        // TypeScript "import x = require(...)"
                        node->kind = NodeKind::VariableDeclaration;
                        node->declared.push_back(ident_at(j));
                        const std::size_t end = statement_end(j);
                        add_references(*node, j + 1, end);
                        node->span = span_of(i, end);
                        return end;
                    }
                    node->bindings.push_back(ImportBinding{tokens_[j].text, "default", tokens_[j].span, node->type_only});
                    ++j;
                    if (is(j, ",")) {
                        ++j;
                    } else if (!is(j, "from")) {
                        return malformed();
                    }
                }

                if (is(j, "*")) {
                    if (!is(j + 1, "as") || !is_binding_ident(j + 2)) {
                        return malformed();
                    }
                    node->bindings.push_back(ImportBinding{tokens_[j + 2].text, "*", tokens_[j + 2].span, node->type_only});
                    j += 3;
                } else if (is(j, "{")) {
                    const bool ok = parse_specifiers(j, [&](const std::size_t name, const std::size_t alias, const bool type_only) {
                        const std::size_t local = alias == npos ? name : alias;
                        node->bindings.push_back(ImportBinding{
                            tokens_[local].text, name_of(name), tokens_[local].span, node->type_only || type_only
                        });
                    });
                    if (!ok) {
                        return malformed();
                    }
                    j = match_[j] + 1;
                }

                if (!is(j, "from") || !is_string(j + 1)) {
                    return malformed();
                }
                set_source(*node, j + 1);

                const std::size_t end = finish_module_statement(j + 2);
                node->span = span_of(i, end);
                return end;
            }

            std::size_t parse_export(const std::size_t i) {
                Node* node = new_node(NodeKind::ExportDeclaration);
                std::size_t j = i + 1;
                std::size_t end = tokens_.size();

                if (is(j, "type") && (is(j + 1, "{") || is(j + 1, "*"))) {
                    node->type_only = true;
                    ++j;
                }

                if (is(j, "*")) {
                    std::string_view exported = "*";
                    Span span = tokens_[j].span;
                    ++j;
                    if (is(j, "as") && (is_ident(j + 1) || is_string(j + 1))) {
                        exported = name_of(j + 1);
                        span = tokens_[j + 1].span;
                        j += 2;
                    }
                    if (!is(j, "from") || !is_string(j + 1)) {
                        fail("Malformed export declaration", span_of(i, std::min(j + 1, tokens_.size())));
                        return tokens_.size();
                    }
                    node->bindings.push_back(ImportBinding{{}, exported, span, node->type_only});
                    set_source(*node, j + 1);
                    end = finish_module_statement(j + 2);
                } else if (is(j, "{")) {
                    const std::size_t open = j;
                    const bool ok = parse_specifiers(open, [&](const std::size_t name, const std::size_t alias, const bool type_only) {
                        const std::size_t exported = alias == npos ? name : alias;
                        node->bindings.push_back(ImportBinding{
                            name_of(name), name_of(exported), tokens_[exported].span, node->type_only || type_only
                        });
                    });
                    if (!ok) {
                        fail("Malformed export declaration", span_of(i, match_[open] + 1));
                        return tokens_.size();
                    }
                    j = match_[open] + 1;
                    if (is(j, "from") && is_string(j + 1)) {
                        set_source(*node, j + 1);
                        end = finish_module_statement(j + 2);
                    } else {
                        // local names exported from this module are uses
                        for (const auto& binding : node->bindings) {
                            if (!binding.local.empty() && !reserved_words().contains(binding.local)) {
                                node->references.push_back(Identifier{binding.local, binding.span});
                            }
                        }
                        end = is(j, ";") ? j + 1 : j;
                    }
                } else if (is(j, "default")) {
                    node->is_default_export = true;
                    if (const auto decl = parse_declaration(j + 1, *node);
                        decl && decl->kind != NodeKind::VariableDeclaration) {
                        end = decl->end;
                    } else {
                        node->declared.clear();
                        node->references.clear();
                        end = statement_end(j + 1);
                        add_references(*node, j + 1, end);
                    }
                    const std::string_view local = node->declared.empty() ? std::string_view{} : node->declared.front().name;
                    node->bindings.push_back(ImportBinding{local, "default", tokens_[j].span, false});
                } else if (const auto decl = parse_declaration(j, *node)) {
                    end = decl->end;
                    for (const auto& name : node->declared) {
                        node->bindings.push_back(ImportBinding{name.name, name.name, name.span, false});
                    }
                } else {
                    // TypeScript forms: interface, type alias, enum, declare, "export =".
                    if ((is(j, "interface") || is(j, "type") || is(j, "enum")) && is_binding_ident(j + 1)) {
                        node->declared.push_back(ident_at(j + 1));
                        node->bindings.push_back(ImportBinding{tokens_[j + 1].text, tokens_[j + 1].text, tokens_[j + 1].span, true});
                    }
                    end = statement_end(j);
                    add_references(*node, j, end);
                }

                node->span = span_of(i, end);
                lift_debuggers(i, end);
                return end;
            }

            std::size_t parse_statement(const std::size_t i) {
                if (is(i, "import") && !is(i + 1, "(") && !is(i + 1, ".")) {
                    return parse_import(i);
                }
                if (is(i, "export")) {
                    return parse_export(i);
                }
                if (is(i, "debugger")) {
                    Node* node = new_node(NodeKind::DebuggerStatement);
                    const std::size_t end = statement_end(i);
                    node->span = span_of(i, end);
                    return end;
                }

                Node* node = arena_.make<Node>(NodeKind::ExpressionStatement, &arena_);
                tree_.body.push_back(node);

                std::size_t end;
                if (const auto decl = parse_declaration(i, *node)) {
                    node->kind = decl->kind;
                    end = decl->end;
                } else {
                    end = statement_end(i);
                    add_references(*node, i, end);
                }

                if (end <= i) {
                    // a stray closing bracket cannot start a statement
                    end = i + 1;
                }

                node->span = span_of(i, end);
                lift_debuggers(i, end);
                return end;
            }

            memory::Arena& arena_;
            const Segment& segment_;
            const std::pmr::vector<Token>& tokens_;
            StructuralTree& tree_;
            std::pmr::vector<std::size_t> match_;
            std::optional<Diagnostic> error_;
        };

    }  // namespace

    Result<StructuralTree*, Diagnostics> ScriptParser::parse(
        memory::Arena& arena,
        const Segment& segment
    ) const {
        std::pmr::vector<Token> tokens(&arena);
        tokens.reserve(segment.text.size() / 4 + 1);

        Lexer lexer(segment.text, segment.source_type.jsx, tokens);
        if (auto err = lexer.run()) {
            Diagnostic d;
            d.span = err->span.shifted(segment.offset);
            d.severity = Severity::Error;
            d.code = std::string(codes::parse);
            d.message = std::move(err->message);
            return Result<StructuralTree*, Diagnostics>::failure(Diagnostics{std::move(d)});
        }

        auto* tree = arena.make<StructuralTree>(&arena);
        tree->text = segment.text;
        tree->source_type = segment.source_type;

        StatementParser parser(arena, segment, tokens, *tree);
        if (auto err = parser.run()) {
            return Result<StructuralTree*, Diagnostics>::failure(Diagnostics{std::move(*err)});
        }

        return Result<StructuralTree*, Diagnostics>::success(tree);
    }

}  // namespace modlint::loader
