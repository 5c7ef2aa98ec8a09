#include "envsync/env_file.hpp"
#include "envsync/sync.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;

// Synthetic document: groups of commented variables separated by blank lines.
static std::string make_doc(size_t vars, bool empty_values){
    std::string s;
    for(size_t i = 0; i < vars; ++i){
        if(i % 8 == 0) s += "\n# Section " + std::to_string(i / 8) + "\n";
        s += "KEY_" + std::to_string(i) + "=";
        if(!empty_values || i % 3 == 0) s += "value_" + std::to_string(i);
        if(i % 4 == 0) s += " # note " + std::to_string(i);
        s += "\n";
    }
    return s;
}

struct RunResult { double ms_parse; double ms_sync; size_t out_bytes; };

static RunResult bench_case(const std::string& local_src, const std::string& template_src, int iters){
    RunResult r{0.0, 0.0, 0};
    for(int i = 0; i < iters; ++i){
        auto t0 = Clock::now();
        auto local = envsync::parse(local_src);
        auto tmpl = envsync::parse(template_src);
        auto t1 = Clock::now();
        auto merged = envsync::sync(local, std::move(tmpl));
        auto out = envsync::to_string(merged);
        auto t2 = Clock::now();
        r.ms_parse += std::chrono::duration<double, std::milli>(t1 - t0).count();
        r.ms_sync += std::chrono::duration<double, std::milli>(t2 - t1).count();
        r.out_bytes = out.size();
    }
    r.ms_parse /= iters;
    r.ms_sync /= iters;
    return r;
}

int main(int argc, char** argv){
    int iters = 200;
    if(argc > 1) iters = std::max(1, std::atoi(argv[1]));

    struct Case { const char* name; size_t vars; };
    std::vector<Case> cases{ {"small", 16}, {"typical", 128}, {"large", 2048} };

    try{
        for(auto& c : cases){
            auto local = make_doc(c.vars, false);
            auto tmpl = make_doc(c.vars + c.vars / 4, true);
            auto r = bench_case(local, tmpl, iters);
            std::cout << "[bench] " << c.name << ": parse " << r.ms_parse << " ms, sync+serialize "
                      << r.ms_sync << " ms, " << r.out_bytes << " bytes\n";
        }
    }catch(const std::exception& e){
        std::cerr << "[bench] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
