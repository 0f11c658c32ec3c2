#include "StyleSheetParser.hpp"
#include "VeneerLogging.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace veneer {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return s;
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Line/column of `offset` inside a chunk that started at (line, column).
std::pair<int, int> positionOf(std::string_view chunk, size_t offset, int line, int column) {
    for (size_t i = 0; i < offset && i < chunk.size(); ++i) {
        if (chunk[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

bool startsUrl(std::string_view s, size_t i) {
    return i + 4 <= s.size()
        && std::tolower(static_cast<unsigned char>(s[i])) == 'u'
        && std::tolower(static_cast<unsigned char>(s[i + 1])) == 'r'
        && std::tolower(static_cast<unsigned char>(s[i + 2])) == 'l'
        && s[i + 3] == '(';
}

// Index of the ')' closing a url( whose contents start at `from`, or npos.
size_t urlClose(std::string_view s, size_t from) {
    char quote = 0;
    for (size_t i = from; i < s.size(); ++i) {
        if (quote) {
            if (s[i] == '\\') {
                ++i;
            } else if (s[i] == quote) {
                quote = 0;
            }
        } else if (s[i] == '"' || s[i] == '\'') {
            quote = s[i];
        } else if (s[i] == ')') {
            return i;
        }
    }
    return std::string_view::npos;
}

// Collapse whitespace runs outside quotes and url(...) to a single space.
// url() contents are paths, so they are copied as written.
std::string collapseWhitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    char quote = 0;
    bool pendingSpace = false;
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (!quote && startsUrl(s, i)) {
            if (pendingSpace) {
                out += ' ';
                pendingSpace = false;
            }
            const size_t close = urlClose(s, i + 4);
            const size_t end = close == std::string_view::npos ? s.size() : close + 1;
            out.append(s.substr(i, end - i));
            i = end - 1;
            continue;
        }
        if (quote) {
            out += c;
            if (c == '\\' && i + 1 < s.size()) {
                out += s[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (isSpace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        if (c == '"' || c == '\'') quote = c;
        out += c;
    }
    return out;
}

// Text read by the scanner, with the offsets (into `text`) of strings that
// were cut off at a newline. Each such string is closed where it was cut.
struct Chunk {
    std::string text;
    std::vector<size_t> brokenStrings;
};

class Scanner {
public:
    enum class Stop { Found, EndOfInput, UnterminatedComment, OpenBrace };

    explicit Scanner(std::string_view text) : m_text(text) {}

    bool atEnd() const { return m_pos >= m_text.size(); }
    char peek() const { return atEnd() ? '\0' : m_text[m_pos]; }
    int line() const { return m_line; }
    int column() const { return m_column; }

    void advance() {
        if (atEnd()) return;
        if (m_text[m_pos] == '\n') {
            ++m_line;
            m_column = 1;
        } else {
            ++m_column;
        }
        ++m_pos;
    }

    Stop skipWhitespaceAndComments() {
        while (!atEnd()) {
            if (isSpace(peek())) {
                advance();
            } else if (startsComment()) {
                if (!skipComment(nullptr)) return Stop::UnterminatedComment;
            } else {
                break;
            }
        }
        return atEnd() ? Stop::EndOfInput : Stop::Found;
    }

    // Copies input up to a top-level stop character. Comments are blanked
    // (newlines kept so line numbers survive), strings are copied verbatim,
    // and stop characters inside parentheses do not count.
    Stop readUntil(std::string_view stops, Chunk& out) {
        int parens = 0;
        while (!atEnd()) {
            const char c = peek();
            if (startsComment()) {
                if (!skipComment(&out.text)) return Stop::UnterminatedComment;
                continue;
            }
            if (c == '"' || c == '\'') {
                readString(out);
                continue;
            }
            if (parens == 0 && stops.find(c) != std::string_view::npos) return Stop::Found;
            if (c == '(') {
                ++parens;
            } else if (c == ')' && parens > 0) {
                --parens;
            }
            out.text += c;
            advance();
        }
        return Stop::EndOfInput;
    }

    // Reads a declaration block up to its '}'. Blocks do not nest, so a '{'
    // means this block was never closed: the block ends at the last line
    // break or ';' before it, and the scanner rewinds there so the text that
    // follows is read as the next rule.
    Stop readBlock(Chunk& out) {
        Mark resume = mark();
        size_t resumeSize = out.text.size();
        size_t resumeBroken = out.brokenStrings.size();
        int parens = 0;
        while (!atEnd()) {
            const char c = peek();
            if (startsComment()) {
                if (!skipComment(&out.text)) return Stop::UnterminatedComment;
                continue;
            }
            if (c == '"' || c == '\'') {
                readString(out);
                continue;
            }
            if (parens == 0 && c == '}') return Stop::Found;
            if (parens == 0 && c == '{') {
                reset(resume);
                out.text.resize(resumeSize);
                out.brokenStrings.resize(resumeBroken);
                return Stop::OpenBrace;
            }
            if (c == '(') {
                ++parens;
            } else if (c == ')' && parens > 0) {
                --parens;
            }
            out.text += c;
            advance();
            if (parens == 0 && (c == '\n' || c == ';')) {
                resume = mark();
                resumeSize = out.text.size();
                resumeBroken = out.brokenStrings.size();
            }
        }
        return Stop::EndOfInput;
    }

private:
    struct Mark {
        size_t pos;
        int line;
        int column;
    };

    Mark mark() const { return {m_pos, m_line, m_column}; }

    void reset(const Mark& m) {
        m_pos = m.pos;
        m_line = m.line;
        m_column = m.column;
    }

    bool startsComment() const {
        return m_pos + 1 < m_text.size() && m_text[m_pos] == '/' && m_text[m_pos + 1] == '*';
    }

    bool skipComment(std::string* out) {
        advance();
        advance();
        if (out) *out += "  ";
        while (!atEnd()) {
            if (m_text[m_pos] == '*' && m_pos + 1 < m_text.size() && m_text[m_pos + 1] == '/') {
                advance();
                advance();
                if (out) *out += "  ";
                return true;
            }
            if (out) *out += m_text[m_pos] == '\n' ? '\n' : ' ';
            advance();
        }
        return false;
    }

    // A string runs to its closing quote. One cut off by a newline (or the
    // end of input) ends there: it is closed, its declaration is ended, and
    // it is recorded as broken.
    void readString(Chunk& out) {
        const char quote = peek();
        const size_t start = out.text.size();
        out.text += quote;
        advance();
        while (!atEnd()) {
            const char c = peek();
            if (c == '\\') {
                out.text += c;
                advance();
                if (!atEnd()) {
                    out.text += peek();
                    advance();
                }
                continue;
            }
            if (c == '\n') break;
            out.text += c;
            advance();
            if (c == quote) return;
        }
        if (out.text.back() == '\\') out.text.pop_back();
        out.text += quote;
        out.text += ';';
        out.brokenStrings.push_back(start);
    }

    std::string_view m_text;
    size_t m_pos = 0;
    int m_line = 1;
    int m_column = 1;
};

const char* describeStop(Scanner::Stop stop) {
    switch (stop) {
        case Scanner::Stop::UnterminatedComment: return "unterminated comment";
        case Scanner::Stop::OpenBrace:           return "missing '}'";
        default:                                 return "unexpected end of input";
    }
}

bool containsBrokenString(const Chunk& chunk, size_t begin, size_t end) {
    return std::any_of(chunk.brokenStrings.begin(), chunk.brokenStrings.end(),
                       [&](size_t at) { return at >= begin && at < end; });
}

struct SelectorError {
    size_t offset = 0;
    std::string message;
};

size_t readIdent(std::string_view s, size_t& i) {
    const size_t start = i;
    while (i < s.size() && isIdentChar(s[i])) ++i;
    return i - start;
}

bool parseCompound(std::string_view s, size_t& i, SelectorPart& part, SelectorError& err) {
    const size_t start = i;
    if (i < s.size() && s[i] == '.') {
        part.exactType = true;
        ++i;
    }
    if (i < s.size() && s[i] == '*') {
        part.typeName = "*";
        ++i;
    } else {
        const size_t from = i;
        part.typeName = std::string(s.substr(from, readIdent(s, i)));
    }
    if (part.exactType && part.typeName.empty()) {
        err = {i, "expected class name after '.'"};
        return false;
    }

    while (i < s.size()) {
        const char c = s[i];
        if (c == '#') {
            const size_t at = i++;
            const size_t from = i;
            const size_t len = readIdent(s, i);
            if (len == 0) {
                err = {at, "expected object name after '#'"};
                return false;
            }
            if (!part.objectName.empty()) {
                err = {at, "more than one object name in selector"};
                return false;
            }
            part.objectName = std::string(s.substr(from, len));
        } else if (c == '[') {
            const size_t at = i++;
            char quote = 0;
            size_t close = std::string_view::npos;
            for (size_t j = i; j < s.size(); ++j) {
                if (quote) {
                    if (s[j] == quote) quote = 0;
                } else if (s[j] == '"' || s[j] == '\'') {
                    quote = s[j];
                } else if (s[j] == ']') {
                    close = j;
                    break;
                }
            }
            if (close == std::string_view::npos) {
                err = {at, "unterminated attribute selector"};
                return false;
            }
            const auto content = trim(s.substr(i, close - i));
            if (content.empty()) {
                err = {at, "empty attribute selector"};
                return false;
            }
            part.attributes.emplace_back(content);
            i = close + 1;
        } else if (c == ':') {
            const size_t at = i;
            if (i + 1 < s.size() && s[i + 1] == ':') {
                i += 2;
                const size_t from = i;
                const size_t len = readIdent(s, i);
                if (len == 0) {
                    err = {at, "expected sub-control name after '::'"};
                    return false;
                }
                if (!part.subControl.empty()) {
                    err = {at, "more than one sub-control in selector"};
                    return false;
                }
                part.subControl = std::string(s.substr(from, len));
            } else {
                ++i;
                PseudoState state;
                if (i < s.size() && s[i] == '!') {
                    state.negated = true;
                    ++i;
                }
                const size_t from = i;
                const size_t len = readIdent(s, i);
                if (len == 0) {
                    err = {at, "expected pseudo-state name after ':'"};
                    return false;
                }
                state.name = std::string(s.substr(from, len));
                part.pseudoStates.push_back(std::move(state));
            }
        } else {
            break;
        }
    }

    if (i == start) {
        err = {i, std::string("unexpected character '") + s[i] + "' in selector"};
        return false;
    }
    return true;
}

bool parseSelector(std::string_view s, Selector& selector, SelectorError& err) {
    size_t i = 0;
    auto skipSpace = [&]() {
        const size_t from = i;
        while (i < s.size() && isSpace(s[i])) ++i;
        return i > from;
    };

    skipSpace();
    bool childNext = false;
    while (i < s.size()) {
        SelectorPart part;
        if (!parseCompound(s, i, part, err)) return false;
        if (!selector.parts.empty()) {
            selector.combinators.push_back(childNext ? Combinator::Child : Combinator::Descendant);
        }
        selector.parts.push_back(std::move(part));
        childNext = false;

        const bool sawSpace = skipSpace();
        if (i >= s.size()) break;
        if (s[i] == '>') {
            const size_t at = i++;
            skipSpace();
            if (i >= s.size()) {
                err = {at, "'>' without a selector after it"};
                return false;
            }
            childNext = true;
            continue;
        }
        if (!sawSpace) {
            err = {i, std::string("unexpected character '") + s[i] + "' in selector"};
            return false;
        }
    }

    if (selector.parts.empty()) {
        err = {0, "missing selector"};
        return false;
    }
    return true;
}

void parseDeclarationList(const Chunk& chunk, int line, int column,
                          std::vector<Declaration>& out, std::vector<Diagnostic>& diagnostics) {
    const std::string_view body = chunk.text;
    auto report = [&](size_t offset, std::string message) {
        const auto [l, c] = positionOf(body, offset, line, column);
        diagnostics.push_back({Severity::Error, l, c, std::move(message)});
    };

    auto handleSegment = [&](size_t begin, size_t end) {
        const auto raw = body.substr(begin, end - begin);
        const auto segment = trim(raw);
        if (segment.empty()) return;
        const size_t segOffset = begin + static_cast<size_t>(segment.data() - raw.data());

        if (containsBrokenString(chunk, begin, end)) {
            report(segOffset, "unterminated string in declaration \"" + std::string(segment) + "\"");
            return;
        }

        const size_t colon = segment.find(':');
        if (colon == std::string_view::npos) {
            report(segOffset, "expected ':' in declaration \"" + std::string(segment) + "\"");
            return;
        }
        const auto name = trim(segment.substr(0, colon));
        const auto value = trim(segment.substr(colon + 1));
        if (name.empty() || !std::all_of(name.begin(), name.end(), isIdentChar)) {
            report(segOffset, "invalid property name \"" + std::string(name) + "\"");
            return;
        }
        if (value.empty()) {
            report(segOffset, "missing value for property \"" + std::string(name) + "\"");
            return;
        }

        Declaration decl;
        // qproperty-<name> targets a Q_PROPERTY, whose name is case-sensitive
        decl.property = name.rfind("qproperty-", 0) == 0 ? std::string(name) : toLower(name);
        decl.value = collapseWhitespace(value);
        decl.line = positionOf(body, segOffset, line, column).first;
        out.push_back(std::move(decl));
    };

    int parens = 0;
    char quote = 0;
    size_t begin = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '(') {
            ++parens;
        } else if (c == ')' && parens > 0) {
            --parens;
        } else if (c == ';' && parens == 0) {
            handleSegment(begin, i);
            begin = i + 1;
        }
    }
    handleSegment(begin, body.size());
}

} // namespace

size_t ParseResult::errorCount() const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const Diagnostic& d) { return d.severity == Severity::Error; }));
}

bool StyleSheetParser::parseSelectorGroup(std::string_view text, std::vector<Selector>& out,
                                          std::vector<Diagnostic>& diagnostics,
                                          int line, int column) {
    std::vector<Selector> parsed;
    auto fail = [&](size_t offset, std::string message) {
        const auto [l, c] = positionOf(text, offset, line, column);
        diagnostics.push_back({Severity::Error, l, c, std::move(message)});
        return false;
    };

    if (trim(text).empty()) return fail(0, "missing selector before '{'");

    size_t begin = 0;
    char quote = 0;
    int brackets = 0;
    for (size_t i = 0; i <= text.size(); ++i) {
        const bool atEnd = i == text.size();
        if (!atEnd) {
            const char c = text[i];
            if (quote) {
                if (c == quote) quote = 0;
                continue;
            }
            if (c == '"' || c == '\'') { quote = c; continue; }
            if (c == '[') { ++brackets; continue; }
            if (c == ']' && brackets > 0) { --brackets; continue; }
            if (c != ',' || brackets > 0) continue;
        }

        const auto piece = text.substr(begin, i - begin);
        if (trim(piece).empty()) return fail(begin, "empty selector in selector group");

        Selector selector;
        SelectorError err;
        if (!parseSelector(piece, selector, err)) return fail(begin + err.offset, err.message);
        parsed.push_back(std::move(selector));
        begin = i + 1;
    }

    out.insert(out.end(), std::make_move_iterator(parsed.begin()), std::make_move_iterator(parsed.end()));
    return true;
}

ParseResult StyleSheetParser::parse(std::string_view text) {
    ParseResult result;
    auto error = [&](int line, int column, std::string message) {
        result.diagnostics.push_back({Severity::Error, line, column, std::move(message)});
    };

    Scanner scanner(text);
    while (true) {
        const auto lead = scanner.skipWhitespaceAndComments();
        if (lead == Scanner::Stop::UnterminatedComment) {
            error(scanner.line(), scanner.column(), "unterminated comment");
            break;
        }
        if (lead == Scanner::Stop::EndOfInput) break;

        const int line = scanner.line();
        const int column = scanner.column();
        if (scanner.peek() == '}') {
            error(line, column, "unexpected '}'");
            scanner.advance();
            continue;
        }

        Chunk prelude;
        const auto preludeStop = scanner.readUntil("{}", prelude);
        const std::string shown(trim(prelude.text));
        if (preludeStop != Scanner::Stop::Found) {
            error(line, column, preludeStop == Scanner::Stop::EndOfInput
                  ? "expected '{' after \"" + shown + "\""
                  : std::string(describeStop(preludeStop)));
            break;
        }
        if (scanner.peek() == '}') {
            error(line, column, "expected '{' after \"" + shown + "\"");
            scanner.advance();
            continue;
        }
        scanner.advance();

        const int bodyLine = scanner.line();
        const int bodyColumn = scanner.column();
        Chunk body;
        const auto bodyStop = scanner.readBlock(body);
        if (bodyStop == Scanner::Stop::EndOfInput || bodyStop == Scanner::Stop::UnterminatedComment) {
            error(line, column, std::string(describeStop(bodyStop)) + " in block for \"" + shown + "\"");
            break;
        }
        const bool closed = bodyStop == Scanner::Stop::Found;
        if (closed) scanner.advance();

        StyleRule rule;
        rule.line = line;
        if (!prelude.brokenStrings.empty()) {
            error(line, column, "unterminated string in selector \"" + shown + "\"");
            continue;
        }
        if (!parseSelectorGroup(prelude.text, rule.selectors, result.diagnostics, line, column)) {
            continue;
        }
        parseDeclarationList(body, bodyLine, bodyColumn, rule.declarations, result.diagnostics);
        if (!closed) {
            // Declarations were still checked; the unclosed rule itself is dropped
            error(line, column, "missing '}' for \"" + shown + "\"");
            continue;
        }
        result.sheet.addRule(std::move(rule));
    }

    vLog_Style("Parsed stylesheet:" << result.sheet.size() << "rules,"
               << result.diagnostics.size() << "diagnostics");
    return result;
}

ParseResult StyleSheetParser::parseDeclarations(std::string_view text) {
    ParseResult result;

    // Run the scanner once to drop comments and catch unterminated strings
    Scanner scanner(text);
    Chunk body;
    const auto stop = scanner.readUntil("{}", body);
    if (stop == Scanner::Stop::Found) {
        result.diagnostics.push_back({Severity::Error, scanner.line(), scanner.column(),
                                      std::string("unexpected '") + scanner.peek() + "' in declaration list"});
        return result;
    }
    if (stop != Scanner::Stop::EndOfInput) {
        result.diagnostics.push_back({Severity::Error, scanner.line(), scanner.column(), describeStop(stop)});
        return result;
    }

    StyleRule rule;
    rule.line = 1;
    parseDeclarationList(body, 1, 1, rule.declarations, result.diagnostics);
    if (!rule.declarations.empty()) result.sheet.addRule(std::move(rule));
    return result;
}

} // namespace veneer
