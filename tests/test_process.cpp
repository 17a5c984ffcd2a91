#include <catch2/catch.hpp>
#include "process.hpp"
#include <stdexcept>

using namespace cronreg;

TEST_CASE("run_process: captures stdout and exit status", "[process]") {
    auto r = run_process({"/bin/sh", "-c", "echo hello; exit 3"});
    REQUIRE(r.out == "hello\n");
    REQUIRE(r.exit_code == 3);
    REQUIRE_FALSE(r.success());
}

TEST_CASE("run_process: stderr is captured separately", "[process]") {
    auto r = run_process({"/bin/sh", "-c", "echo out; echo err >&2"});
    REQUIRE(r.success());
    REQUIRE(r.out == "out\n");
    REQUIRE(r.err == "err\n");
}

TEST_CASE("run_process: feeds stdin", "[process]") {
    auto r = run_process({"cat"}, "line one\nline two\n");
    REQUIRE(r.success());
    REQUIRE(r.out == "line one\nline two\n");
}

TEST_CASE("run_process: large input echoed back does not stall", "[process]") {
    // Well beyond the pipe buffer on both the stdin and stdout side
    std::string input(256 * 1024, 'x');
    input += "\nend\n";
    auto r = run_process({"cat"}, input);
    REQUIRE(r.success());
    REQUIRE(r.out.size() == input.size());
    REQUIRE(r.out == input);
}

TEST_CASE("run_process: child ignoring its input still completes", "[process]") {
    auto r = run_process({"/bin/sh", "-c", "exec 0<&-; echo done"},
                         std::string(256 * 1024, 'y'));
    REQUIRE(r.success());
    REQUIRE(r.out == "done\n");
}

TEST_CASE("run_process: missing program exits 127", "[process]") {
    auto r = run_process({"/nonexistent/cronreg-program"});
    REQUIRE(r.exit_code == 127);
    REQUIRE_FALSE(r.err.empty());
}

TEST_CASE("run_process: signal termination", "[process]") {
    auto r = run_process({"/bin/sh", "-c", "kill -TERM $$"});
    REQUIRE(r.signaled);
    REQUIRE_FALSE(r.success());
}

TEST_CASE("run_process: empty argv", "[process]") {
    REQUIRE_THROWS_AS(run_process({}), std::runtime_error);
}
