// Comment-preserving .env document model: entries, parsing and serialization
#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace envsync
{

    struct parse_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    // A non-empty line that is neither a comment nor a key=value assignment.
    // raw() is the offending line with surrounding whitespace trimmed.
    struct invalid_line : parse_error
    {
        invalid_line(std::string raw, int line);
        const std::string &raw() const { return raw_; }
        int line() const { return line_; }

    private:
        std::string raw_;
        int line_;
    };

    inline constexpr char comment_prefix = '#';
    inline constexpr char assignment_operator = '=';

    // Comment text without the leading marker (and without one following space).
    struct comment
    {
        std::string text;
    };

    struct variable
    {
        std::string key;
        std::string value;
        std::vector<comment> preceding_comments;
        std::optional<comment> inline_comment;
    };

    struct orphan_comment
    {
        comment text;
    };

    struct empty_line
    {
    };

    using entry = std::variant<variable, orphan_comment, empty_line>;

    struct env_file
    {
        std::vector<entry> entries;

        // First variable with the given key, or nullptr.
        const variable *get(std::string_view key) const;
        variable *get(std::string_view key);

        // Overwrite the first matching variable's value and return the previous one.
        // Appends a new comment-less variable when the key is absent.
        std::optional<std::string> set(std::string_view key, std::string value);

        // Variable keys in document order (duplicates included).
        std::vector<std::string> keys() const;
    };

    inline bool operator==(const comment &a, const comment &b) { return a.text == b.text; }
    inline bool operator==(const variable &a, const variable &b)
    {
        return a.key == b.key && a.value == b.value && a.preceding_comments == b.preceding_comments &&
               a.inline_comment == b.inline_comment;
    }
    inline bool operator==(const orphan_comment &a, const orphan_comment &b) { return a.text == b.text; }
    inline bool operator==(const empty_line &, const empty_line &) { return true; }
    inline bool operator==(const env_file &a, const env_file &b) { return a.entries == b.entries; }

    // Build a comment from the text that followed the '#' marker.
    comment make_comment(std::string_view body);

    // Parse a whole document. Throws invalid_line for the first line that is not
    // blank, a comment, or an assignment; no partial document is returned.
    env_file parse(std::string_view text);

    struct ParseResult
    {
        bool success{false};
        env_file file;
        std::string error_message; // If !success, human-readable message
        int line{0};
        std::string raw_line;
    };

    // Non-throwing variant of parse() for callers that report errors themselves.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>");

    std::string to_string(const comment &c);
    // Preceding comments and the assignment line, without a trailing newline.
    std::string to_string(const variable &v);
    std::string to_string(const entry &e);
    std::string to_string(const env_file &f);

    inline bool is_variable(const entry &e) { return std::holds_alternative<variable>(e); }
    inline bool is_orphan_comment(const entry &e) { return std::holds_alternative<orphan_comment>(e); }
    inline bool is_empty_line(const entry &e) { return std::holds_alternative<empty_line>(e); }
    inline const variable *as_variable(const entry &e) { return std::get_if<variable>(&e); }
    inline variable *as_variable(entry &e) { return std::get_if<variable>(&e); }
    inline const orphan_comment *as_orphan_comment(const entry &e) { return std::get_if<orphan_comment>(&e); }

    // ------ Factory helpers ------

    inline variable make_variable(std::string key, std::string value)
    {
        variable v;
        v.key = std::move(key);
        v.value = std::move(value);
        return v;
    }
    inline variable make_variable(std::string key, std::string value, std::string inline_text)
    {
        variable v = make_variable(std::move(key), std::move(value));
        v.inline_comment = comment{std::move(inline_text)};
        return v;
    }
    inline orphan_comment make_orphan(std::string text) { return orphan_comment{comment{std::move(text)}}; }

} // namespace envsync
