#include "test_utils.hpp"
#include "cliutil/common/error_codes.hpp"
#include "cliutil/params/parameter_set.hpp"

using namespace cliutil::params;
using cliutil::common::ErrorCode;
using cliutil::common::ParameterError;

class ParameterSetTest : public ::testing::Test {
protected:
    ParameterSet set;
    CLI::App app{"parameter test"};
    
    void SetUp() override {
        set.declare("items", "n", ParameterType::INTEGER, 1000LL, "Number of items");
        set.declare("title", "t", ParameterType::STRING, std::string("Work"));
        set.declare("quiet", "q", ParameterType::BOOLEAN, false);
        set.declare("rotator", "r", ParameterType::ARRAY, std::vector<std::string>{"|", "/"});
        set.declare("limit", "T", ParameterType::TIME_SECONDS, std::string("90s"));
        set.declare("verbosity", "verb", ParameterType::STRING, std::string("sep"));
        set.bind(&app);
    }
    
    void parse(std::vector<const char*> args) {
        args.insert(args.begin(), "test");
        app.parse(static_cast<int>(args.size()), args.data());
        set.resolve();
    }
};

TEST_F(ParameterSetTest, defaults_before_resolve) {
    EXPECT_EQ(1000LL, set.get<long long>("items"));
    EXPECT_EQ(90LL, set.get<long long>("limit"));
    EXPECT_FALSE(set.get<bool>("quiet"));
}

TEST_F(ParameterSetTest, defaults_when_not_given) {
    parse({});
    
    EXPECT_EQ(1000LL, set.get<long long>("items"));
    EXPECT_EQ("Work", set.get<std::string>("title"));
    EXPECT_FALSE(set.get<bool>("quiet"));
    EXPECT_EQ((std::vector<std::string>{"|", "/"}), set.get<std::vector<std::string>>("rotator"));
    EXPECT_EQ(90LL, set.get<long long>("limit"));
}

TEST_F(ParameterSetTest, converts_command_line_values) {
    parse({"--items", "25x", "-t", "Copy files", "-q", "-r", "x+'y z'", "-T", "2m"});
    
    EXPECT_EQ(25LL, set.get<long long>("items"));
    EXPECT_EQ("Copy files", set.get<std::string>("title"));
    EXPECT_TRUE(set.get<bool>("quiet"));
    EXPECT_EQ((std::vector<std::string>{"x", "y z"}), set.get<std::vector<std::string>>("rotator"));
    EXPECT_EQ(120LL, set.get<long long>("limit"));
}

TEST_F(ParameterSetTest, long_alias_is_an_option_name) {
    parse({"--verb", "si"});
    EXPECT_EQ("si", set.get<std::string>("verbosity"));
}

TEST_F(ParameterSetTest, lookup_by_alias) {
    parse({"-n", "7"});
    
    EXPECT_TRUE(set.isDeclared("n"));
    EXPECT_EQ(7LL, set.get<long long>("n"));
    EXPECT_EQ(7LL, set.get<long long>("items"));
}

TEST_F(ParameterSetTest, undeclared_parameter_raises) {
    EXPECT_FALSE(set.isDeclared("missing"));
    try {
        set.get<long long>("missing");
        FAIL() << "expected ParameterError";
    } catch (const ParameterError& e) {
        EXPECT_EQ(ErrorCode::PARAMETER_NOT_DECLARED, e.code());
    }
}

TEST_F(ParameterSetTest, wrong_type_raises) {
    try {
        set.get<std::string>("items");
        FAIL() << "expected ParameterError";
    } catch (const ParameterError& e) {
        EXPECT_EQ(ErrorCode::PARAMETER_TYPE_MISMATCH, e.code());
    }
}

TEST(ParameterSet, mismatched_default_is_rejected) {
    ParameterSet set;
    EXPECT_THROW(set.declare("items", "n", ParameterType::INTEGER, std::string("10")), ParameterError);
    EXPECT_THROW(set.declare("limit", "T", ParameterType::TIME_SECONDS, 90LL), ParameterError);
    EXPECT_FALSE(set.isDeclared("items"));
}

TEST(ParameterSet, redeclaring_replaces) {
    ParameterSet set;
    set.declare("items", "n", ParameterType::INTEGER, 10LL);
    set.declare("items", "i", ParameterType::INTEGER, 20LL);
    
    EXPECT_EQ(1u, set.declarations().size());
    EXPECT_EQ(20LL, set.get<long long>("i"));
    EXPECT_FALSE(set.isDeclared("n"));
}
