#include <catch2/catch.hpp>

#include "output/text_output.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string slurp(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream text;
    if (in) text << in.rdbuf();
    return text.str();
}

}

TEST_CASE("The typing command receives the text on stdin", "[output]") {
    testing::TempDir tmp;
    const fs::path typed = tmp.path() / "typed.txt";
    const fs::path enter = tmp.path() / "enter.txt";

    CommandTextOutput output("cat > '" + typed.string() + "'", "echo enter > '" + enter.string() + "'");

    SECTION("text only") {
        output.deliver("Καλημέρα, world", false);
        CHECK(slurp(typed) == "Καλημέρα, world");
        CHECK_FALSE(fs::exists(enter));
    }

    SECTION("text followed by Enter") {
        output.deliver("done", true);
        CHECK(slurp(typed) == "done");
        CHECK(slurp(enter) == "enter\n");
    }

    SECTION("empty text still sends Enter") {
        output.deliver("", true);
        CHECK_FALSE(fs::exists(typed));
        CHECK(slurp(enter) == "enter\n");
    }
}

TEST_CASE("A failing typing command is logged, not thrown", "[output]") {
    testing::TempDir tmp;
    const fs::path enter = tmp.path() / "enter.txt";

    CommandTextOutput output("cat > /dev/null; exit 3", "echo enter > '" + enter.string() + "'");
    CHECK_NOTHROW(output.deliver("lost", true));
    // A failed type step skips the Enter keystroke.
    CHECK_FALSE(fs::exists(enter));
}
