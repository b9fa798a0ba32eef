#include <gtest/gtest.h>
#include "cli_options.hpp"
#include <vector>

namespace {

std::optional<cli::Options> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "sheet_diagram_cli");
    return cli::parse_args(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(CliOptionsTest, ParseIntRejectsValuesOutsideInt) {
    EXPECT_EQ(cli::parse_int("42"), 42);
    EXPECT_EQ(cli::parse_int("-7"), -7);
    EXPECT_EQ(cli::parse_int("2147483647"), 2147483647);
    EXPECT_FALSE(cli::parse_int("2147483648"));
    EXPECT_FALSE(cli::parse_int("99999999999"));
    EXPECT_FALSE(cli::parse_int("99999999999999999999999"));
    EXPECT_FALSE(cli::parse_int(""));
    EXPECT_FALSE(cli::parse_int("12px"));
}

TEST(CliOptionsTest, OversizedSheetIdIsAUsageError) {
    EXPECT_FALSE(parse({ "--sheet-requests", "B2", "--sheet-id", "99999999999" }));
    EXPECT_FALSE(parse({ "--sheet-requests", "B2", "--sheet-id", "-1" }));
    auto opts = parse({ "--sheet-requests", "B2", "--sheet-id", "123456" });
    ASSERT_TRUE(opts);
    EXPECT_EQ(opts->sheet_id, 123456);
    EXPECT_EQ(opts->sheet_anchor, "B2");
}

TEST(CliOptionsTest, WidthMustBeInLayoutRange) {
    EXPECT_FALSE(parse({ "--width", "7" }));
    EXPECT_FALSE(parse({ "--width", "401" }));
    EXPECT_FALSE(parse({ "--width", "4294967356" }));
    auto opts = parse({ "--width", "8" });
    ASSERT_TRUE(opts);
    EXPECT_EQ(opts->width, 8);
}

TEST(CliOptionsTest, MissingValuesAndUnknownFlags) {
    EXPECT_FALSE(parse({ "--input" }));
    EXPECT_FALSE(parse({ "--bogus" }));
    EXPECT_FALSE(parse({ "--sheet-requests", "A1" }));
}

TEST(CliOptionsTest, OverridesApplyToDemoRequest) {
    auto opts = parse({ "--demo", "--strict", "--frame", "--width", "40" });
    ASSERT_TRUE(opts);
    EXPECT_TRUE(opts->demo);

    diagram_model::DiagramRequest request;
    cli::apply_overrides(*opts, request);
    EXPECT_TRUE(request.strict);
    EXPECT_TRUE(request.frame);
    EXPECT_EQ(request.width, 40);
}

TEST(CliOptionsTest, AbsentFlagsKeepRequestSettings) {
    auto opts = parse({});
    ASSERT_TRUE(opts);
    diagram_model::DiagramRequest request;
    request.width = 72;
    request.frame = true;
    request.strict = true;
    cli::apply_overrides(*opts, request);
    EXPECT_EQ(request.width, 72);
    EXPECT_TRUE(request.frame);
    EXPECT_TRUE(request.strict);
}
