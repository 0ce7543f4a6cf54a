// ═══════════════════════════════════════════════════════════════════
//  parser.cpp — Query text → operation type + selection tree
// ═══════════════════════════════════════════════════════════════════

#include "miniql/parser.h"
#include "miniql/console.h"
#include "miniql/error.h"

#include <algorithm>
#include <cctype>

namespace miniql {

namespace detail {

inline bool isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool isIdentChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

inline std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && isWhitespace(s[begin])) begin++;
    while (end > begin && isWhitespace(s[end - 1])) end--;
    return s.substr(begin, end - begin);
}

// Drops every `#` comment up to the end of its line, together with
// the whitespace written before it.
inline std::string stripComments(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '#') {
            while (!out.empty() && isWhitespace(out.back())) out.pop_back();
            while (i < text.size() && text[i] != '\n') i++;
            continue;
        }
        out += text[i++];
    }
    return out;
}

// ── Cursor over one selection body ──
class Scanner {
public:
    explicit Scanner(const std::string& source) : source_(source), pos_(0) {}

    bool atEnd() const { return pos_ >= source_.size(); }
    std::size_t position() const { return pos_; }

    char peek() const {
        return pos_ < source_.size() ? source_[pos_] : '\0';
    }

    void skipWhitespace() {
        while (pos_ < source_.size() && isWhitespace(source_[pos_])) {
            pos_++;
        }
    }

    // Empty when the cursor is not on an identifier
    std::string readIdentifier() {
        std::size_t start = pos_;
        while (pos_ < source_.size() && isIdentChar(source_[pos_])) {
            pos_++;
        }
        return source_.substr(start, pos_ - start);
    }

    // Consumes a `{ ... }` block starting at the cursor and returns it,
    // braces included.
    std::string captureBlock(const std::string& fieldName) {
        std::size_t start = pos_;
        int depth = 0;
        do {
            char c = source_[pos_++];
            if (c == '{') depth++;
            else if (c == '}') depth--;
        } while (depth > 0 && pos_ < source_.size());

        if (depth != 0) {
            throw Error(ErrorCategory::Syntax,
                        "Unbalanced braces in field '" + fieldName + "'.");
        }
        return source_.substr(start, pos_ - start);
    }

    std::string excerpt(std::size_t from, std::size_t length = 20) const {
        return source_.substr(std::min(from, source_.size()), length);
    }

private:
    const std::string& source_;
    std::size_t pos_;
};

} // namespace detail

// ═══════════════════════════════════════════
//  Selection tree helpers
// ═══════════════════════════════════════════

void addSelection(SelectionSet& set, FieldSelection selection) {
    auto it = std::find_if(set.begin(), set.end(), [&](const FieldSelection& existing) {
        return existing.name == selection.name;
    });
    if (it != set.end()) {
        it->selections = std::move(selection.selections);
    } else {
        set.push_back(std::move(selection));
    }
}

Json toJson(const SelectionSet& set) {
    Json j = Json::object();
    for (const auto& field : set) {
        j[field.name] = toJson(field.selections);
    }
    return j;
}

Json toJson(const ParsedQuery& query) {
    return Json{
        {"operationType", query.operationType},
        {"fields", toJson(query.selections)}
    };
}

// ═══════════════════════════════════════════
//  QueryParser
// ═══════════════════════════════════════════

ParsedQuery QueryParser::parse(const std::string& queryText) const {
    auto text = detail::trim(detail::stripComments(queryText));
    if (text.empty()) {
        throw Error(ErrorCategory::Syntax, "Empty query string.");
    }

    ParsedQuery result;
    std::string body;

    if (text.front() == '{') {
        result.operationType = "query";
        body = text;
    } else {
        // Keyword, optional whitespace, then the opening brace
        std::size_t pos = 0;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
            pos++;
        }
        std::string keyword = text.substr(0, pos);
        std::transform(keyword.begin(), keyword.end(), keyword.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        while (pos < text.size() && detail::isWhitespace(text[pos])) {
            pos++;
        }

        if ((keyword != "query" && keyword != "mutation") || pos >= text.size() || text[pos] != '{') {
            throw Error(ErrorCategory::Syntax,
                        "Unsupported query format. Expected 'query {' or 'mutation {' or '{'.");
        }
        result.operationType = keyword;
        body = detail::trim(text.substr(pos));
    }

    auto opening = std::count(body.begin(), body.end(), '{');
    auto closing = std::count(body.begin(), body.end(), '}');
    if (opening != closing) {
        throw Error(ErrorCategory::Syntax, "Mismatched curly braces in query.");
    }

    result.selections = parseFields(body);
    console::debug("Parsed", result.operationType, toJson(result.selections).dump());
    return result;
}

SelectionSet QueryParser::parseFields(const std::string& body) const {
    auto text = detail::trim(body);

    // Outer braces of this level
    if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
        text = detail::trim(text.substr(1, text.size() - 2));
    }

    SelectionSet fields;
    if (text.empty()) {
        return fields;
    }

    detail::Scanner scanner(text);
    while (!scanner.atEnd()) {
        auto start = scanner.position();
        scanner.skipWhitespace();

        FieldSelection field;
        field.name = scanner.readIdentifier();
        if (field.name.empty()) {
            throw Error(ErrorCategory::Syntax,
                        "Unexpected token near: " + scanner.excerpt(start) + "...");
        }
        scanner.skipWhitespace();

        if (scanner.peek() == '{') {
            field.selections = parseFields(scanner.captureBlock(field.name));
        }

        addSelection(fields, std::move(field));
    }

    return fields;
}

} // namespace miniql
