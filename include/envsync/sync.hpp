// Template/local reconciliation and the file-level sync driver
#pragma once
#include "envsync/env_file.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace envsync
{

    inline constexpr const char *default_local_filename = ".env";
    inline constexpr const char *default_template_filename = ".env.template";

    // Merge local into the template. The template's entries (order, comments, key
    // set) are the skeleton of the result; for each template variable with a local
    // counterpart (first match by key), local supplies:
    //   - the value, if the template value is empty and local's is not;
    //   - the inline comment, if the template has none;
    //   - the preceding comments (whole list), if the template has none.
    // Local-only keys are dropped. Never fails.
    env_file sync(const env_file &local, env_file tmpl);

    enum class sync_errc
    {
        template_not_found,
        create_local,
        local_io,
        template_io,
        local_parse,
        template_parse,
        write
    };

    const char *to_string(sync_errc code);

    class sync_error : public std::runtime_error
    {
    public:
        sync_error(sync_errc code, std::filesystem::path path, std::string detail, int line = 0,
                   std::string raw_line = {});

        sync_errc code() const { return code_; }
        const std::filesystem::path &path() const { return path_; }
        // OS error text, or the parse message for *_parse codes.
        const std::string &detail() const { return detail_; }
        // Set only for local_parse / template_parse.
        int line() const { return line_; }
        const std::string &raw_line() const { return raw_line_; }

    private:
        sync_errc code_;
        std::filesystem::path path_;
        std::string detail_;
        int line_;
        std::string raw_line_;
    };

    struct SyncOptions
    {
        std::optional<std::filesystem::path> local_file; // defaults to <cwd>/.env
        std::filesystem::path template_file{default_template_filename};
    };

    struct SyncReport
    {
        std::filesystem::path local_path;
        std::filesystem::path template_path;
        bool created_local{false};
        std::size_t entries_written{0};
    };

    std::filesystem::path resolve_local_path(const SyncOptions &options);

    // Truncate path and write content to it. Throws sync_error (write).
    void write_file(const std::filesystem::path &path, const std::string &content);

    // Read both files, merge and write the result to the local path. A missing
    // local file is created empty first; a missing template is an error.
    // Throws sync_error.
    SyncReport sync_files(const SyncOptions &options);

} // namespace envsync
