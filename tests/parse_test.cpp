#include <gtest/gtest.h>
#include <string>
#include "envsync/env_file.hpp"

using namespace envsync;

static const variable& var_at(const env_file& f, size_t i){
    const variable* v = as_variable(f.entries.at(i));
    if(!v) throw std::runtime_error("entry " + std::to_string(i) + " is not a variable");
    return *v;
}

TEST(Parse, SimpleAssignments){
    auto f = parse("KEY=value\nANOTHER=test");
    ASSERT_EQ(f.entries.size(), 2u);
    EXPECT_EQ(var_at(f, 0).key, "KEY");
    EXPECT_EQ(var_at(f, 0).value, "value");
    EXPECT_EQ(var_at(f, 1).key, "ANOTHER");
    EXPECT_EQ(var_at(f, 1).value, "test");
}

TEST(Parse, BareAssignmentHasEmptyValue){
    auto f = parse("KEY=");
    ASSERT_EQ(f.entries.size(), 1u);
    const auto& v = var_at(f, 0);
    EXPECT_EQ(v.key, "KEY");
    EXPECT_EQ(v.value, "");
    EXPECT_TRUE(v.preceding_comments.empty());
    EXPECT_FALSE(v.inline_comment.has_value());

    auto ws = parse("KEY=   ");
    EXPECT_EQ(var_at(ws, 0).value, "");
}

TEST(Parse, InlineCommentSplit){
    auto f = parse("KEY=value # note");
    const auto& v = var_at(f, 0);
    EXPECT_EQ(v.value, "value");
    ASSERT_TRUE(v.inline_comment.has_value());
    EXPECT_EQ(v.inline_comment->text, "note");
    EXPECT_EQ(to_string(*v.inline_comment), "# note");
}

TEST(Parse, PrecedingCommentsBindToNextVariable){
    auto f = parse("# This is a comment\nKEY=value\n# Another comment\n# Multi line\nTEST=123");
    ASSERT_EQ(f.entries.size(), 2u);
    const auto& key = var_at(f, 0);
    ASSERT_EQ(key.preceding_comments.size(), 1u);
    EXPECT_EQ(to_string(key.preceding_comments[0]), "# This is a comment");
    const auto& test = var_at(f, 1);
    ASSERT_EQ(test.preceding_comments.size(), 2u);
    EXPECT_EQ(to_string(test.preceding_comments[0]), "# Another comment");
    EXPECT_EQ(to_string(test.preceding_comments[1]), "# Multi line");
}

TEST(Parse, CommentThenBlankIsOrphaned){
    auto f = parse("# a\n\nKEY=b");
    env_file expected;
    expected.entries.emplace_back(make_orphan("a"));
    expected.entries.emplace_back(empty_line{});
    expected.entries.emplace_back(make_variable("KEY", "b"));
    EXPECT_EQ(f, expected);
    EXPECT_EQ(to_string(f.entries[0]), "# a\n");
}

TEST(Parse, EachCommentOfAnOrphanRunIsAnEntry){
    auto f = parse("# one\n# two\n\nKEY=1\n# trailing\n# end");
    ASSERT_EQ(f.entries.size(), 6u);
    EXPECT_TRUE(is_orphan_comment(f.entries[0]));
    EXPECT_TRUE(is_orphan_comment(f.entries[1]));
    EXPECT_TRUE(is_empty_line(f.entries[2]));
    EXPECT_TRUE(var_at(f, 3).preceding_comments.empty());
    EXPECT_EQ(as_orphan_comment(f.entries[4])->text.text, "trailing");
    EXPECT_EQ(as_orphan_comment(f.entries[5])->text.text, "end");
}

TEST(Parse, OnlyFirstEqualsSplits){
    auto f = parse("URL=postgres://u:p@h/db?sslmode=require");
    EXPECT_EQ(var_at(f, 0).key, "URL");
    EXPECT_EQ(var_at(f, 0).value, "postgres://u:p@h/db?sslmode=require");
}

TEST(Parse, FirstHashAlwaysStartsInlineComment){
    auto f = parse("COLOR=#ff0000");
    const auto& v = var_at(f, 0);
    EXPECT_EQ(v.value, "");
    ASSERT_TRUE(v.inline_comment.has_value());
    EXPECT_EQ(v.inline_comment->text, "ff0000");
}

TEST(Parse, WhitespaceTrimmedInternalKept){
    auto f = parse("   MY KEY  =  hello   world   #   spaced note  ");
    const auto& v = var_at(f, 0);
    EXPECT_EQ(v.key, "MY KEY");
    EXPECT_EQ(v.value, "hello   world");
    ASSERT_TRUE(v.inline_comment.has_value());
    EXPECT_EQ(v.inline_comment->text, "  spaced note");
}

TEST(Parse, CrLfLineEndings){
    auto f = parse("# head\r\nKEY=value # c\r\n\r\nOTHER=\r\n");
    ASSERT_EQ(f.entries.size(), 3u);
    const auto& key = var_at(f, 0);
    EXPECT_EQ(key.value, "value");
    ASSERT_EQ(key.preceding_comments.size(), 1u);
    EXPECT_EQ(key.preceding_comments[0].text, "head");
    EXPECT_EQ(key.inline_comment->text, "c");
    EXPECT_TRUE(is_empty_line(f.entries[1]));
    EXPECT_EQ(var_at(f, 2).value, "");
    EXPECT_EQ(f, parse("# head\nKEY=value # c\n\nOTHER=\n"));
}

TEST(Parse, TrailingNewlineAddsNoEntry){
    EXPECT_TRUE(parse("").entries.empty());
    EXPECT_EQ(parse("A=1\n").entries.size(), 1u);
    ASSERT_EQ(parse("A=1\n\n").entries.size(), 2u);
    EXPECT_TRUE(is_empty_line(parse("\n").entries.at(0)));
}

TEST(Parse, InvalidLineIsRejected){
    try{
        (void)parse("not a valid line");
        FAIL() << "expected invalid_line";
    }catch(const invalid_line& e){
        EXPECT_EQ(e.raw(), "not a valid line");
        EXPECT_EQ(e.line(), 1);
        EXPECT_EQ(std::string(e.what()), "invalid line: not a valid line");
    }
}

TEST(Parse, InvalidLineReportsLineNumber){
    try{
        (void)parse("A=1\n# c\n  broken  \nB=2");
        FAIL() << "expected invalid_line";
    }catch(const invalid_line& e){
        EXPECT_EQ(e.raw(), "broken");
        EXPECT_EQ(e.line(), 3);
    }
}

TEST(Parse, UnterminatedGarbageIsAnInvalidLine){
    try{
        (void)parse("A=1\n\t\x01\x02");
        FAIL() << "expected invalid_line";
    }catch(const invalid_line& e){
        EXPECT_EQ(e.raw(), "\x01\x02");
        EXPECT_EQ(e.line(), 2);
    }
}

TEST(Parse, OnlyAsciiWhitespaceIsTrimmed){
    // U+00A0 (no-break space) is value content
    auto f = parse("KEY=v\xC2\xA0");
    EXPECT_EQ(var_at(f, 0).value, "v\xC2\xA0");
}

TEST(Parse, ParseStringReportsInsteadOfThrowing){
    auto ok = parse_string("A=1", "ok.env");
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.file.entries.size(), 1u);

    auto bad = parse_string("A=1\noops", ".env.template");
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.line, 2);
    EXPECT_EQ(bad.raw_line, "oops");
    EXPECT_EQ(bad.error_message, ".env.template:2: invalid line: oops");
}

TEST(Serialize, CanonicalForm){
    auto f = parse("#top\nKEY = v   #inline\n\n#   indented\n##  Section\n#\nX=");
    EXPECT_EQ(to_string(f), "# top\nKEY=v # inline\n\n#   indented\n##  Section\n#\nX=\n");
}

TEST(Serialize, RoundTripLaw){
    const char* inputs[] = {
        "# Comment\nKEY=value\n\n# Orphan\nTEST=123 # inline",
        "KEY=\n=odd\nA#B=c\n",
        "## Header\n#\n#  two spaces\nK=v ##x\n\n\n# tail",
        "  spaced = out  \r\n\r\n#c\r\n",
        "",
    };
    for(const char* in : inputs){
        auto once = parse(in);
        auto twice = parse(to_string(once));
        EXPECT_EQ(once, twice) << "input: " << in;
        EXPECT_EQ(to_string(once), to_string(twice));
    }
}

TEST(EnvFile, GetReturnsFirstMatch){
    auto f = parse("A=1\nB=2\nA=3");
    ASSERT_NE(f.get("A"), nullptr);
    EXPECT_EQ(f.get("A")->value, "1");
    EXPECT_EQ(f.get("missing"), nullptr);
    std::vector<std::string> keys{"A", "B", "A"};
    EXPECT_EQ(f.keys(), keys);
}

TEST(EnvFile, SetOverwritesOrAppends){
    auto f = parse("# c\nA=1 # keep\n");
    auto old = f.set("A", "2");
    ASSERT_TRUE(old.has_value());
    EXPECT_EQ(*old, "1");
    EXPECT_EQ(f.get("A")->value, "2");
    EXPECT_EQ(f.get("A")->inline_comment->text, "keep");

    EXPECT_FALSE(f.set("NEW", "x").has_value());
    EXPECT_EQ(to_string(f), "# c\nA=2 # keep\nNEW=x\n");
}

TEST(Serialize, BuiltDocument){
    env_file f;
    auto db = make_variable("DB_PORT", "5432", "Default postgres port");
    db.preceding_comments.push_back(comment{"Database"});
    f.entries.emplace_back(std::move(db));
    f.entries.emplace_back(empty_line{});
    f.entries.emplace_back(make_orphan("## Section"));
    EXPECT_TRUE(is_variable(f.entries[0]));
    EXPECT_EQ(to_string(f), "# Database\nDB_PORT=5432 # Default postgres port\n\n### Section\n");
    EXPECT_EQ(parse(to_string(f)), f);
}
