#include "envsync/cli.hpp"
#include "envsync/diagnostics_json.hpp"
#include <exception>
#include <ostream>
#include <string>

#ifndef ENVSYNC_VERSION
#define ENVSYNC_VERSION "0.0.0"
#endif

namespace envsync {

void print_usage(std::ostream& os){
    os << "usage: envsync [-l|--local PATH] [-t|--template PATH] [-v|-vv|--verbose]\n"
          "Easily update your local env file with a git-trackable file.\n"
          "  -l, --local PATH     local env file (default: ./.env)\n"
          "  -t, --template PATH  template file (default: .env.template)\n"
          "  -v, --verbose        -v for debug, -vv for trace output\n"
          "  -h, --help           show this help\n"
          "  -V, --version        print version\n";
}

std::optional<CliOptions> parse_args(int argc, const char* const* argv, std::ostream& err){
    CliOptions opts;
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i];
        auto value = [&](const std::string& flag)->const char*{
            if(i + 1 >= argc){ err << "envsync: missing value for " << flag << "\n"; return nullptr; }
            return argv[++i];
        };
        if(a == "-l" || a == "--local"){
            const char* v = value(a); if(!v) return std::nullopt;
            opts.sync.local_file = v;
        } else if(a.rfind("--local=", 0) == 0){
            opts.sync.local_file = a.substr(8);
        } else if(a == "-t" || a == "--template"){
            const char* v = value(a); if(!v) return std::nullopt;
            opts.sync.template_file = v;
        } else if(a.rfind("--template=", 0) == 0){
            opts.sync.template_file = a.substr(11);
        } else if(a == "--verbose"){
            ++opts.verbose;
        } else if(a.size() > 1 && a[0] == '-' && a[1] == 'v' && a.find_first_not_of('v', 1) == std::string::npos){
            opts.verbose += static_cast<int>(a.size() - 1); // -v, -vv, -vvv
        } else if(a == "-h" || a == "--help"){
            opts.help = true;
        } else if(a == "-V" || a == "--version"){
            opts.version = true;
        } else {
            err << "envsync: unknown argument '" << a << "'\n";
            print_usage(err);
            return std::nullopt;
        }
    }
    return opts;
}

LogLevel effective_log_level(const CliOptions& opts, const SyncEnv& env){
    return env.logLevel ? *env.logLevel : level_from_verbosity(opts.verbose);
}

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err){
    auto opts = parse_args(argc, argv, err);
    if(!opts) return 2;
    if(opts->help){ print_usage(out); return 0; }
    if(opts->version){ out << "envsync " << ENVSYNC_VERSION << "\n"; return 0; }

    const auto env = detectEnv();
    set_log_level(effective_log_level(*opts, env));

    try{
        (void)sync_files(opts->sync);
        return 0;
    } catch(const sync_error& e){
        err << "envsync: " << e.what() << "\n";
        maybe_print_json(e);
        return 1;
    } catch(const std::exception& e){
        err << "envsync: exception: " << e.what() << "\n";
        return 1;
    }
}

} // namespace envsync
