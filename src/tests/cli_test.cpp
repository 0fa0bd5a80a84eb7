#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include "dfsnode/cli/cli.hpp"
#include "test_utils.hpp"

using namespace dfsnode;
using ::testing::HasSubstr;
using ::testing::Not;

class CLITest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_test_logging();
        test_dir = test::make_temp_dir("cli_test");
    }

    void TearDown() override {
        node.reset();
        std::filesystem::remove_all(test_dir);
    }

    // Runs the shell over the given script and returns everything it printed
    std::string run_script(const std::string& script) {
        std::istringstream input(script);
        std::ostringstream output;
        cli::CLI shell(logger, test_dir / "received_files", input, output);
        shell.run();
        return output.str();
    }

    std::filesystem::path test_dir;
    logging::Logger logger = logging::make_logger("cli-test");
    std::unique_ptr<test::NodeHarness> node;
};

TEST_F(CLITest, RequiresConnectionFirst) {
    std::string output = run_script("status\nput a.txt\nget a.txt\n");
    EXPECT_THAT(output, HasSubstr("Not connected. Use: connect ip:port"));
    EXPECT_THAT(output, HasSubstr("DFS_Node> "));
}

TEST_F(CLITest, RejectsBadInput) {
    std::string output = run_script("connect localhost\nput\nfrobnicate x\n");
    EXPECT_THAT(output, HasSubstr("Invalid format. Usage: connect ip:port"));
    EXPECT_THAT(output, HasSubstr("Invalid input. Usage: <command> [argument]"));
    EXPECT_THAT(output, HasSubstr("Unknown command or invalid arguments"));
}

TEST_F(CLITest, QuitStopsTheLoop) {
    std::string output = run_script("quit\nhelp\n");
    EXPECT_THAT(output, Not(HasSubstr("Available commands")));

    cli::CLI shell(logger, test_dir, std::cin, std::cout);
    EXPECT_FALSE(shell.execute("quit"));
    EXPECT_TRUE(shell.execute(""));
}

TEST_F(CLITest, Help) {
    EXPECT_THAT(run_script("help\n"), HasSubstr("Available commands"));
}

TEST_F(CLITest, SessionAgainstARunningNode) {
    node = std::make_unique<test::NodeHarness>(test_dir / "storage");
    ASSERT_TRUE(node->start());

    std::filesystem::path src = test_dir / "report.txt";
    test::write_file(src, "hello world");

    std::string endpoint = "127.0.0.1:" + std::to_string(node->port());
    std::string output = run_script(
        "connect " + endpoint + "\n"
        "status\n"
        "put " + src.string() + "\n"
        "get report.txt\n"
        "get missing.txt\n"
        "quit\n");

    EXPECT_THAT(output, HasSubstr("Using storage node " + endpoint));
    EXPECT_THAT(output, HasSubstr("Status succeeded: 200"));
    EXPECT_THAT(output, HasSubstr("Put succeeded: TRANSFER_SUCCESSFUL"));
    EXPECT_THAT(output, HasSubstr("Get succeeded: "));
    EXPECT_THAT(output, HasSubstr("Get failed: File not found: missing.txt"));

    EXPECT_EQ(test::read_file(test_dir / "received_files" / "report.txt"), "hello world");
}
