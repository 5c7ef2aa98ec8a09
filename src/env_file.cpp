// Document queries, comment normalization and serialization.
#include "envsync/env_file.hpp"

namespace envsync {

invalid_line::invalid_line(std::string raw, int line)
    : parse_error("invalid line: " + raw), raw_(std::move(raw)), line_(line) {}

comment make_comment(std::string_view body){
    size_t e = body.size();
    while(e > 0 && (body[e-1]==' ' || body[e-1]=='\t' || body[e-1]=='\r' || body[e-1]=='\v' || body[e-1]=='\f')) --e;
    body = body.substr(0, e);
    if(!body.empty() && body.front()==' ') body.remove_prefix(1);
    return comment{std::string(body)};
}

const variable* env_file::get(std::string_view key) const {
    for(auto& e : entries){
        if(auto* v = as_variable(e); v && v->key == key) return v;
    }
    return nullptr;
}

variable* env_file::get(std::string_view key){
    for(auto& e : entries){
        if(auto* v = as_variable(e); v && v->key == key) return v;
    }
    return nullptr;
}

std::optional<std::string> env_file::set(std::string_view key, std::string value){
    if(auto* v = get(key)){
        std::string old = std::move(v->value);
        v->value = std::move(value);
        return old;
    }
    entries.emplace_back(make_variable(std::string(key), std::move(value)));
    return std::nullopt;
}

std::vector<std::string> env_file::keys() const {
    std::vector<std::string> out;
    for(auto& e : entries){
        if(auto* v = as_variable(e)) out.push_back(v->key);
    }
    return out;
}

// "#" alone for an empty comment; a text that itself starts with '#' is glued
// to the marker so "## Section" headers keep their shape.
std::string to_string(const comment& c){
    if(c.text.empty()) return std::string(1, comment_prefix);
    if(c.text.front() == comment_prefix) return comment_prefix + c.text;
    return std::string(1, comment_prefix) + ' ' + c.text;
}

std::string to_string(const variable& v){
    std::string out;
    for(auto& c : v.preceding_comments){
        out += to_string(c);
        out += '\n';
    }
    out += v.key;
    out += assignment_operator;
    out += v.value;
    if(v.inline_comment){
        out += ' ';
        out += to_string(*v.inline_comment);
    }
    return out;
}

std::string to_string(const entry& e){
    struct V {
        std::string operator()(const variable& v) const { return to_string(v) + '\n'; }
        std::string operator()(const orphan_comment& c) const { return to_string(c.text) + '\n'; }
        std::string operator()(const empty_line&) const { return "\n"; }
    };
    return std::visit(V{}, e);
}

std::string to_string(const env_file& f){
    std::string out;
    for(auto& e : f.entries) out += to_string(e);
    return out;
}

} // namespace envsync
