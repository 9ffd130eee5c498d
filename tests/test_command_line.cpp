#include <catch2/catch.hpp>
#include <string>
#include <vector>
#include "CommandLine.hpp"
// -------------------------------------------------------------------------
namespace
{
    // argv[] поверх вектора строк
    struct Argv
    {
        explicit Argv( std::vector<std::string> a ): args(std::move(a))
        {
            args.insert(args.begin(), "procmonitor");
            for( auto& s : args )
                ptrs.push_back(&s[0]);
            ptrs.push_back(nullptr);
        }
        int argc() const { return int(args.size()); }
        char** argv() { return ptrs.data(); }

        std::vector<std::string> args;
        std::vector<char*> ptrs;
    };
}
// -------------------------------------------------------------------------
TEST_CASE("splitCommand: whitespace separated words", "[cmdline]")
{
    std::vector<std::string> out;
    std::string err;
    REQUIRE(splitCommand("ping  google.com\t-c 3", out, err));
    REQUIRE(out == std::vector<std::string>{"ping", "google.com", "-c", "3"});
}
// -------------------------------------------------------------------------
TEST_CASE("splitCommand: quoting rules", "[cmdline]")
{
    std::vector<std::string> out;
    std::string err;

    SECTION("single quotes keep everything literal")
    {
        REQUIRE(splitCommand(R"(sh -c 'echo "a b"; exit 3')", out, err));
        REQUIRE(out == std::vector<std::string>{"sh", "-c", R"(echo "a b"; exit 3)"});
    }

    SECTION("double quotes honour backslash before quote and backslash")
    {
        REQUIRE(splitCommand(R"(echo "x \"y\" \\z \n")", out, err));
        REQUIRE(out == std::vector<std::string>{"echo", R"(x "y" \z \n)"});
    }

    SECTION("backslash outside quotes escapes the next character")
    {
        REQUIRE(splitCommand(R"(touch a\ b c)", out, err));
        REQUIRE(out == std::vector<std::string>{"touch", "a b", "c"});
    }

    SECTION("adjacent quoted parts join into one word")
    {
        REQUIRE(splitCommand(R"(--opt='a b'"c d"e)", out, err));
        REQUIRE(out == std::vector<std::string>{"--opt=a bc de"});
    }

    SECTION("empty quotes produce an empty argument")
    {
        REQUIRE(splitCommand("printf ''", out, err));
        REQUIRE(out == std::vector<std::string>{"printf", ""});
    }

    SECTION("no variable or glob expansion")
    {
        REQUIRE(splitCommand("echo $HOME *", out, err));
        REQUIRE(out == std::vector<std::string>{"echo", "$HOME", "*"});
    }
}
// -------------------------------------------------------------------------
TEST_CASE("splitCommand: malformed input", "[cmdline]")
{
    std::vector<std::string> out;
    std::string err;

    REQUIRE_FALSE(splitCommand("echo 'abc", out, err));
    REQUIRE(err.find("closing") != std::string::npos);

    err.clear();
    REQUIRE_FALSE(splitCommand("echo \"abc", out, err));
    REQUIRE(err.find("closing") != std::string::npos);

    err.clear();
    REQUIRE_FALSE(splitCommand("echo abc\\", out, err));
    REQUIRE(err.find("escaped") != std::string::npos);
}
// -------------------------------------------------------------------------
TEST_CASE("splitCommand: blank input gives no words", "[cmdline]")
{
    std::vector<std::string> out{"stale"};
    std::string err;
    REQUIRE(splitCommand("   \t ", out, err));
    REQUIRE(out.empty());
}
// -------------------------------------------------------------------------
TEST_CASE("parseArgs: all options, key=value form", "[cmdline]")
{
    Argv a({"--command=ping -c 1 localhost", "--logfile=out.log", "--restart", "--timeout=60", "debug"});
    ProcessConfig cfg;
    std::string err;

    REQUIRE(parseArgs(a.argc(), a.argv(), cfg, err));
    REQUIRE(cfg.command == std::vector<std::string>{"ping", "-c", "1", "localhost"});
    REQUIRE(cfg.logfile == "out.log");
    REQUIRE(cfg.restart);
    REQUIRE(cfg.timeoutSec == 60);
    REQUIRE(cfg.hasTimeout());
    REQUIRE(cfg.debug);
}
// -------------------------------------------------------------------------
TEST_CASE("parseArgs: separate value form and defaults", "[cmdline]")
{
    Argv a({"--command", "echo \"hello world\"", "--logfile", "out.log"});
    ProcessConfig cfg;
    std::string err;

    REQUIRE(parseArgs(a.argc(), a.argv(), cfg, err));
    REQUIRE(cfg.command == std::vector<std::string>{"echo", "hello world"});
    REQUIRE(cfg.logfile == "out.log");
    REQUIRE_FALSE(cfg.restart);
    REQUIRE_FALSE(cfg.hasTimeout());
    REQUIRE_FALSE(cfg.debug);
}
// -------------------------------------------------------------------------
TEST_CASE("parseArgs: configuration errors", "[cmdline]")
{
    ProcessConfig cfg;
    std::string err;

    SECTION("missing logfile")
    {
        Argv a({"--command=echo hi"});
        REQUIRE_FALSE(parseArgs(a.argc(), a.argv(), cfg, err));
        REQUIRE(err.find("required") != std::string::npos);
    }

    SECTION("missing command")
    {
        Argv a({"--logfile=out.log"});
        REQUIRE_FALSE(parseArgs(a.argc(), a.argv(), cfg, err));
    }

    SECTION("missing value at the end")
    {
        Argv a({"--logfile=out.log", "--command"});
        REQUIRE_FALSE(parseArgs(a.argc(), a.argv(), cfg, err));
        REQUIRE(err.find("missing value") != std::string::npos);
    }

    SECTION("non-positive or non-numeric timeout")
    {
        for( const char* t : {"--timeout=0", "--timeout=-3", "--timeout=abc", "--timeout=5s", "--timeout="} )
        {
            Argv a({"--command=echo hi", "--logfile=out.log", t});
            err.clear();
            REQUIRE_FALSE(parseArgs(a.argc(), a.argv(), cfg, err));
            REQUIRE(err.find("timeout") != std::string::npos);
        }
    }

    SECTION("unknown argument")
    {
        Argv a({"--command=echo hi", "--logfile=out.log", "--verbose"});
        REQUIRE_FALSE(parseArgs(a.argc(), a.argv(), cfg, err));
        REQUIRE(err == "unknown argument: --verbose");
    }

    SECTION("unparsable command")
    {
        Argv a({"--command=echo 'oops", "--logfile=out.log"});
        REQUIRE_FALSE(parseArgs(a.argc(), a.argv(), cfg, err));
        REQUIRE(err.find("command parse error") != std::string::npos);
    }

    SECTION("empty command")
    {
        Argv a({"--command=  ", "--logfile=out.log"});
        REQUIRE_FALSE(parseArgs(a.argc(), a.argv(), cfg, err));
        REQUIRE(err == "command is empty");
    }
}
