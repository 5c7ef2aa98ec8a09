// Merge example: parse a local file and a template, merge, print the result.
#include <iostream>
#include <string>
#include "envsync/env_file.hpp"
#include "envsync/sync.hpp"

using namespace envsync;

int main(){
    const char* local_src = R"ENV(# Database configuration
API_KEY=secret123 # Keep this secret!
DB_HOST=localhost
DB_PORT=
LEGACY_FLAG=1
)ENV";

    const char* template_src = R"ENV(# Database configuration
API_KEY=
DB_HOST=production.example.com
DB_PORT=5432 # Default postgres port

# New feature
NEW_VAR=default # Feature flag
)ENV";

    try{
        env_file local = parse(local_src);
        env_file tmpl = parse(template_src);
        env_file merged = sync(local, std::move(tmpl));
        std::cout << to_string(merged);
        // LEGACY_FLAG is local-only and does not survive the merge.
        std::cout << "# keys: " << merged.keys().size() << ", LEGACY_FLAG kept: " << (merged.get("LEGACY_FLAG") ? "yes" : "no") << "\n";
    } catch(const invalid_line& e){
        std::cerr << "line " << e.line() << ": " << e.what() << "\n";
        return 1;
    }
    return 0;
}
