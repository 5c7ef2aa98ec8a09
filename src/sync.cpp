#include "envsync/sync.hpp"
#include "envsync/log.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace envsync {

env_file sync(const env_file& local, env_file tmpl){
    for(auto& e : tmpl.entries){
        auto* tv = as_variable(e);
        if(!tv) continue;
        const variable* lv = local.get(tv->key);
        if(!lv) continue;
        if(tv->value.empty() && !lv->value.empty())
            tv->value = lv->value;
        if(!tv->inline_comment && lv->inline_comment)
            tv->inline_comment = lv->inline_comment;
        if(tv->preceding_comments.empty() && !lv->preceding_comments.empty())
            tv->preceding_comments = lv->preceding_comments;
    }
    return tmpl;
}

const char* to_string(sync_errc code){
    switch(code){
        case sync_errc::template_not_found: return "template_not_found";
        case sync_errc::create_local: return "create_local";
        case sync_errc::local_io: return "local_io";
        case sync_errc::template_io: return "template_io";
        case sync_errc::local_parse: return "local_parse";
        case sync_errc::template_parse: return "template_parse";
        case sync_errc::write: return "write";
    }
    return "unknown";
}

static std::string describe(sync_errc code, const std::filesystem::path& path, const std::string& detail){
    const std::string p = path.string();
    switch(code){
        case sync_errc::template_not_found: return "template file not found: " + p;
        case sync_errc::create_local: return "failed to create local file " + p + ": " + detail;
        case sync_errc::local_io: return "local file IO error (" + p + "): " + detail;
        case sync_errc::template_io: return "template file IO error (" + p + "): " + detail;
        case sync_errc::local_parse: return "local file parse error: " + detail;
        case sync_errc::template_parse: return "template file parse error: " + detail;
        case sync_errc::write: return "write error (" + p + "): " + detail;
    }
    return detail;
}

sync_error::sync_error(sync_errc code, std::filesystem::path path, std::string detail, int line, std::string raw_line)
    : std::runtime_error(describe(code, path, detail)), code_(code), path_(std::move(path)),
      detail_(std::move(detail)), line_(line), raw_line_(std::move(raw_line)) {}

static std::string os_error(){ return std::generic_category().message(errno); }

static std::string read_file(const std::filesystem::path& path, sync_errc code){
    std::error_code ec;
    if(std::filesystem::is_directory(path, ec))
        throw sync_error(code, path, std::make_error_code(std::errc::is_a_directory).message());
    errno = 0;
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) throw sync_error(code, path, os_error());
    std::stringstream ss; ss << ifs.rdbuf();
    if(ifs.bad()) throw sync_error(code, path, os_error());
    return ss.str();
}

static env_file parse_file(const std::string& src, const std::filesystem::path& path, sync_errc code){
    auto res = parse_string(src, path.string());
    if(!res.success) throw sync_error(code, path, res.error_message, res.line, res.raw_line);
    return std::move(res.file);
}

void write_file(const std::filesystem::path& path, const std::string& content){
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out) throw sync_error(sync_errc::write, path, os_error());
    out << content;
    out.flush();
    if(!out) throw sync_error(sync_errc::write, path, os_error());
}

std::filesystem::path resolve_local_path(const SyncOptions& options){
    if(options.local_file) return *options.local_file;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if(ec) cwd = ".";
    return cwd / default_local_filename;
}

SyncReport sync_files(const SyncOptions& options){
    log_msg(LogLevel::Info, "starting env sync");
    SyncReport report;
    report.local_path = resolve_local_path(options);
    report.template_path = options.template_file;
    log_msg(LogLevel::Debug, "resolved paths: local=%s template=%s",
         report.local_path.string().c_str(), report.template_path.string().c_str());

    std::error_code ec;
    if(!std::filesystem::exists(report.template_path, ec))
        throw sync_error(sync_errc::template_not_found, report.template_path, ec ? ec.message() : std::string());

    if(!std::filesystem::exists(report.local_path, ec)){
        log_msg(LogLevel::Debug, "creating local file: %s", report.local_path.string().c_str());
        errno = 0;
        std::ofstream create(report.local_path, std::ios::binary);
        if(!create) throw sync_error(sync_errc::create_local, report.local_path, os_error());
        report.created_local = true;
    }

    const std::string local_src = read_file(report.local_path, sync_errc::local_io);
    const std::string template_src = read_file(report.template_path, sync_errc::template_io);

    env_file local = parse_file(local_src, report.local_path, sync_errc::local_parse);
    env_file tmpl = parse_file(template_src, report.template_path, sync_errc::template_parse);
    log_msg(LogLevel::Debug, "parsed %zu local entries, %zu template entries", local.entries.size(), tmpl.entries.size());

    env_file synced = sync(local, std::move(tmpl));
    const std::string content = to_string(synced);
    log_msg(LogLevel::Trace, "synced content:\n%s", content.c_str());

    log_msg(LogLevel::Debug, "writing synced content to %s", report.local_path.string().c_str());
    write_file(report.local_path, content);

    report.entries_written = synced.entries.size();
    log_msg(LogLevel::Info, "sync completed: %zu entries written to %s", report.entries_written,
         report.local_path.string().c_str());
    return report;
}

} // namespace envsync
