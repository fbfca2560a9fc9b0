#include "test_utils.hpp"
#include "cliutil/params/help_renderer.hpp"

using namespace cliutil::params;

namespace {

HelpInfo demo_info() {
    HelpInfo info;
    info.script_name = "demo";
    info.script_version = "1.0";
    info.description = "A short tool.";
    info.width = 40;
    return info;
}

}

TEST(HelpRenderer, renders_header_description_and_parameters) {
    ParameterSet set;
    set.declare("count", "c", ParameterType::INTEGER, 5LL, "How many");
    set.declare("limit", "l", ParameterType::TIME_SECONDS, std::string("90s"));
    
    std::string expected =
        "-----------\n"
        "demo v. 1.0\n"
        "-----------\n"
        "\n"
        "  A short tool.\n"
        "\n"
        "Parameters\n"
        "----------\n"
        "\n"
        "  * count (c) [integer]; default: 5\n"
        "\n"
        "    How many\n"
        "\n"
        "  * limit (l) [time in seconds]; default: 90s (1 minute 30 seconds)\n";
    
    EXPECT_EQ(expected, HelpRenderer(demo_info()).render(set));
}

TEST(HelpRenderer, omits_parameter_section_when_empty) {
    ParameterSet set;
    std::string help = HelpRenderer(demo_info()).render(set);
    
    EXPECT_EQ(std::string::npos, help.find("Parameters"));
    EXPECT_THAT(help, HasSubstr("A short tool."));
}

TEST(HelpRenderer, wraps_long_descriptions) {
    ParameterSet set;
    set.declare("name", "n", ParameterType::STRING, std::string("x"),
                "This description is clearly longer than the thirty six columns left");
    
    std::string help = HelpRenderer(demo_info()).render(set);
    size_t start = help.find("    This");
    ASSERT_NE(std::string::npos, start);
    size_t end = help.find('\n', start);
    EXPECT_LE(end - start, 40u);
}

TEST(HelpRenderer, default_text_per_type) {
    ParameterDeclaration declaration{"title", "t", ParameterType::STRING, std::string("Copy"), ""};
    EXPECT_EQ("\"Copy\"", HelpRenderer::defaultText(declaration));
    
    declaration = {"quiet", "q", ParameterType::BOOLEAN, false, ""};
    EXPECT_EQ("false", HelpRenderer::defaultText(declaration));
    
    declaration = {"rotator", "r", ParameterType::ARRAY, std::vector<std::string>{"|", "/", "-"}, ""};
    EXPECT_EQ("|+/+-", HelpRenderer::defaultText(declaration));
    
    declaration = {"limit", "T", ParameterType::TIME_SECONDS, std::string("2h"), ""};
    EXPECT_EQ("2h (2 hours 0 minutes 0 seconds)", HelpRenderer::defaultText(declaration));
}
