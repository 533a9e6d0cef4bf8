#include "test_common.hpp"
#include "arg_parser.hpp"
#include "parse_utils.hpp"

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--no-colors", "--concurrency", "4", "./flake", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--no-colors", "--concurrency"}, {},
                     {"--no-colors"});
    REQUIRE(parser.has_flag("--no-colors"));
    REQUIRE(parser.get_option("--concurrency") == "4");
    REQUIRE(parser.positional() == std::vector<std::string>{"./flake"});
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"--unknown"});
}

TEST_CASE("ArgParser switches never swallow the positional") {
    const char* argv[] = {"prog", "--json-log", "/etc/nixos"};
    ArgParser parser(3, const_cast<char**>(argv), {"--json-log"}, {}, {"--json-log"});
    REQUIRE(parser.has_flag("--json-log"));
    REQUIRE(parser.get_option("--json-log").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"/etc/nixos"});
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--log-level=debug"};
    ArgParser parser(2, const_cast<char**>(argv), {"--log-level"});
    REQUIRE(parser.has_flag("--log-level"));
    REQUIRE(parser.get_option("--log-level") == "debug");
}

TEST_CASE("ArgParser value starting with a dash is not consumed") {
    const char* argv[] = {"prog", "--config", "--help"};
    ArgParser parser(3, const_cast<char**>(argv), {"--config", "--help"}, {}, {"--help"});
    REQUIRE(parser.has_flag("--config"));
    REQUIRE(parser.get_option("--config").empty());
    REQUIRE(parser.has_flag("--help"));
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-n8", "-L", "warn"};
    ArgParser parser(5, const_cast<char**>(argv), {"--help", "--concurrency", "--log-level"},
                     {{'h', "--help"}, {'n', "--concurrency"}, {'L', "--log-level"}},
                     {"--help"});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--concurrency") == "8");
    REQUIRE(parser.get_option("--log-level") == "warn");
}

TEST_CASE("ArgParser stacked short switches") {
    const char* argv[] = {"prog", "-hVC"};
    ArgParser parser(2, const_cast<char**>(argv), {"--help", "--version", "--no-colors"},
                     {{'h', "--help"}, {'V', "--version"}, {'C', "--no-colors"}},
                     {"--help", "--version", "--no-colors"});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.has_flag("--version"));
    REQUIRE(parser.has_flag("--no-colors"));
}

TEST_CASE("ArgParser short option value after a switch in a cluster") {
    const char* argv[] = {"prog", "-Cn3"};
    ArgParser parser(2, const_cast<char**>(argv), {"--no-colors", "--concurrency"},
                     {{'C', "--no-colors"}, {'n', "--concurrency"}}, {"--no-colors"});
    REQUIRE(parser.has_flag("--no-colors"));
    REQUIRE(parser.get_option("--concurrency") == "3");
}

TEST_CASE("ArgParser unknown short flag") {
    const char* argv[] = {"prog", "-x"};
    ArgParser parser(2, const_cast<char**>(argv), {"--help"}, {{'h', "--help"}});
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"-x"});
}

TEST_CASE("ArgParser double dash ends options") {
    const char* argv[] = {"prog", "--", "--not-a-flag"};
    ArgParser parser(3, const_cast<char**>(argv), {"--help"});
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"--not-a-flag"});
}

TEST_CASE("parse_size_t bounds") {
    bool ok = false;
    REQUIRE(parse_size_t("10", 1, 256, ok) == 10);
    REQUIRE(ok);
    parse_size_t("0", 1, 256, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("300", 1, 256, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("-1", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("99999999999999999999999", 0, 10, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_size_t from parser") {
    const char* argv[] = {"prog", "--concurrency", "7"};
    ArgParser parser(3, const_cast<char**>(argv), {"--concurrency", "--other"});
    bool ok = false;
    REQUIRE(parse_size_t(parser, "--concurrency", 1, 10, ok) == 7);
    REQUIRE(ok);
    parse_size_t(parser, "--other", 1, 10, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_duration units") {
    bool ok = false;
    REQUIRE(parse_duration("90", ok) == std::chrono::seconds(90));
    REQUIRE(ok);
    REQUIRE(parse_duration("30s", ok) == std::chrono::seconds(30));
    REQUIRE(parse_duration("2m", ok) == std::chrono::seconds(120));
    REQUIRE(parse_duration("1h", ok) == std::chrono::seconds(3600));
    REQUIRE(ok);
    parse_duration("5d", ok);
    REQUIRE_FALSE(ok);
    parse_duration("m", ok);
    REQUIRE_FALSE(ok);
    parse_duration("", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool spellings") {
    bool ok = false;
    REQUIRE(parse_bool("yes", ok));
    REQUIRE(ok);
    REQUIRE(parse_bool("ON", ok));
    REQUIRE(parse_bool("", ok));
    REQUIRE_FALSE(parse_bool("off", ok));
    REQUIRE(ok);
    parse_bool("maybe", ok);
    REQUIRE_FALSE(ok);
}
