#include <gtest/gtest.h>
#include <cli/args.hpp>

static CommandSpec job_gen_spec() {
    CommandSpec spec;
    spec.usage = "job-gen <job-type>";
    spec.value_options = {"num-gpus", "partition", "format"};
    spec.flag_options = {"detailed"};
    spec.min_positionals = 1;
    spec.max_positionals = 1;
    return spec;
}

TEST(Args, ValueForms) {
    auto r = parse_args({"training", "--num-gpus=8", "--partition", "h100", "--detailed"},
                        job_gen_spec());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.positionals, (std::vector<std::string>{"training"}));
    EXPECT_EQ(r.value.value("num-gpus"), "8");
    EXPECT_EQ(r.value.value("partition"), "h100");
    EXPECT_EQ(r.value.value("format", "json"), "json");
    EXPECT_TRUE(r.value.flag("detailed"));
}

TEST(Args, IntValue) {
    auto r = parse_args({"gpu", "--num-gpus", "4"}, job_gen_spec());
    ASSERT_TRUE(r.is_ok());
    auto n = r.value.int_value("num-gpus");
    ASSERT_TRUE(n.is_ok());
    EXPECT_EQ(n.value, 4);
    EXPECT_FALSE(r.value.int_value("partition").value);

    auto bad = parse_args({"gpu", "--num-gpus=four"}, job_gen_spec());
    ASSERT_TRUE(bad.is_ok());
    auto v = bad.value.int_value("num-gpus");
    EXPECT_TRUE(v.is_err());
    EXPECT_EQ(v.kind, ErrorKind::InvalidArgument);
}

TEST(Args, Errors) {
    auto spec = job_gen_spec();
    EXPECT_EQ(parse_args({"gpu", "--bogus"}, spec).error, "Unknown option: --bogus");
    EXPECT_EQ(parse_args({"gpu", "--num-gpus"}, spec).error, "Option --num-gpus requires a value");
    EXPECT_EQ(parse_args({"gpu", "--detailed=yes"}, spec).error, "Option --detailed takes no value");
    EXPECT_EQ(parse_args({}, spec).error, "Missing argument");
    EXPECT_EQ(parse_args({"gpu", "extra"}, spec).error, "Unexpected argument: extra");
    EXPECT_EQ(parse_args({"gpu", "-x"}, spec).kind, ErrorKind::InvalidArgument);
}

TEST(Args, HelpSkipsPositionalCheck) {
    auto r = parse_args({"--help"}, job_gen_spec());
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.help);
}

TEST(Args, DoubleDashEndsOptions) {
    auto r = parse_args({"--", "--odd-name"}, job_gen_spec());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.positionals, (std::vector<std::string>{"--odd-name"}));
}
