#include "cli.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

CliArgs parse(std::vector<const char*> args)
{
    args.insert(args.begin(), "mandelpng");
    return parse_args(static_cast<int>(args.size()), args.data());
}

bool is_usage_error(std::vector<const char*> args)
{
    try {
        parse(std::move(args));
    } catch (const CliError& e) {
        return e.usage_error;
    }
    ADD_FAILURE() << "expected CliError";
    return false;
}

}  // namespace

TEST(ParseArgs, ParsesFullInvocation)
{
    const CliArgs a = parse({"mandel.png", "800x600", "-1.20,0.35", "-1,0.20"});
    EXPECT_EQ(a.out_path, "mandel.png");
    EXPECT_EQ(a.params.bounds.width, 800u);
    EXPECT_EQ(a.params.bounds.height, 600u);
    EXPECT_DOUBLE_EQ(a.params.rect.upper_left.re, -1.20);
    EXPECT_DOUBLE_EQ(a.params.rect.upper_left.im, 0.35);
    EXPECT_DOUBLE_EQ(a.params.rect.lower_right.re, -1.0);
    EXPECT_DOUBLE_EQ(a.params.rect.lower_right.im, 0.20);
    EXPECT_EQ(a.params.max_iter, MAX_ITER);
    EXPECT_EQ(a.threads, 0);
    EXPECT_FALSE(a.verbose);
}

TEST(ParseArgs, AcceptsOptions)
{
    const CliArgs a = parse({"--threads", "3", "--verbose", "o.png", "1x1", "0,0", "0,0"});
    EXPECT_EQ(a.threads, 3);
    EXPECT_TRUE(a.verbose);
    EXPECT_EQ(a.params.bounds.width, 1u);
}

TEST(ParseArgs, WrongArgumentCountIsUsageError)
{
    EXPECT_TRUE(is_usage_error({}));
    EXPECT_TRUE(is_usage_error({"out.png", "800x600", "-1,1"}));
    EXPECT_TRUE(is_usage_error({"out.png", "800x600", "-1,1", "1,-1", "extra"}));
    EXPECT_TRUE(is_usage_error({"--bogus", "out.png", "800x600", "-1,1", "1,-1"}));
}

TEST(ParseArgs, RejectsBadValues)
{
    EXPECT_FALSE(is_usage_error({"out.png", "800by600", "-1,1", "1,-1"}));
    EXPECT_FALSE(is_usage_error({"out.png", "0x600", "-1,1", "1,-1"}));
    EXPECT_FALSE(is_usage_error({"out.png", "800x0", "-1,1", "1,-1"}));
    EXPECT_FALSE(is_usage_error({"out.png", "100000x100000", "-1,1", "1,-1"}));
    EXPECT_FALSE(is_usage_error({"out.png", "800x600", "-1;1", "1,-1"}));
    EXPECT_FALSE(is_usage_error({"out.png", "800x600", "nan,1", "1,-1"}));
    EXPECT_FALSE(is_usage_error({"--threads", "-2", "out.png", "8x6", "-1,1", "1,-1"}));
}

TEST(ParseArgs, RejectsInvertedImaginaryAxis)
{
    EXPECT_THROW(parse({"out.png", "8x6", "-1,-1", "1,1"}), CliError);
    EXPECT_NO_THROW(parse({"out.png", "8x6", "-1,0.5", "1,0.5"}));
}

TEST(ParseArgs, HelpAndBench)
{
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"--bench"}).bench);
    EXPECT_TRUE(is_usage_error({"--bench", "out.png"}));
}

TEST(ParseArgs, AcceptsSidesAboveOneMillion)
{
    const CliArgs wide = parse({"out.png", "1000001x1", "-2,1", "1,-1"});
    EXPECT_EQ(wide.params.bounds.width, 1000001u);
    const CliArgs tall = parse({"out.png", "1x1000001", "-2,1", "1,-1"});
    EXPECT_EQ(tall.params.bounds.height, 1000001u);
}
