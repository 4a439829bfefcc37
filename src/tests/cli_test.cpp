#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>
#include "cli/cli.hpp"
#include "index/memory_index.hpp"
#include "test_utils.hpp"

using namespace fragnet;

class CLITest : public ::testing::Test {
protected:
  TempDir dir{"cli_test"};
  index::MemoryIndex memory_index;
  index::IndexClient index_client{memory_index};
  node::IndexProviderLocator locator{index_client};
  network::TCP_Server transport{0, "127.0.0.1", std::chrono::milliseconds(1000), 2};
  std::unique_ptr<node::Node> node;

  void SetUp() override {
    init_test_logging(boost::log::trivial::fatal);
    node::NodeOptions options;
    options.fragment_size = 1024;
    node = std::make_unique<node::Node>(options, std::make_unique<store::FragmentStore>(),
                                        transport, index_client, locator);
  }

  std::string run_script(const std::string& script, bool* quit_called = nullptr) {
    std::istringstream in(script);
    std::ostringstream out;
    cli::CLI shell(in, out, *node, locator, [quit_called]() {
      if (quit_called) {
        *quit_called = true;
      }
    });
    shell.run();
    return out.str();
  }
};

TEST_F(CLITest, UploadListAndDownload) {
  const auto data = random_bytes(3000);
  const auto source = dir.write_file("notes.txt", data);
  const auto target = dir.path() / "copy.txt";

  const auto output = run_script("upload " + source.string() + "\nls\ndownload notes.txt " +
                                 target.string() + "\n");

  EXPECT_NE(output.find("Uploaded notes.txt: 3 fragments"), std::string::npos);
  EXPECT_NE(output.find("notes.txt\n"), std::string::npos);
  EXPECT_NE(output.find("Downloaded notes.txt"), std::string::npos);
  EXPECT_EQ(dir.read_file("copy.txt"), data);
}

TEST_F(CLITest, ErrorsAreReportedAndShellContinues) {
  const auto output = run_script("download missing.bin\nsearch missing.bin\nbogus arg\nupload\nstats\n");

  EXPECT_NE(output.find("File not found"), std::string::npos);
  EXPECT_NE(output.find("No record for missing.bin"), std::string::npos);
  EXPECT_NE(output.find("Unknown command"), std::string::npos);
  EXPECT_NE(output.find("Invalid input"), std::string::npos);
  EXPECT_NE(output.find("Stored fragments:  0"), std::string::npos);
}

TEST_F(CLITest, PeerCommandAddsStaticPeer) {
  const auto output = run_script("peer 127.0.0.1:4001\npeer nonsense\n");

  EXPECT_NE(output.find("Added peer 127.0.0.1:4001"), std::string::npos);
  EXPECT_NE(output.find("Invalid format"), std::string::npos);
  ASSERT_EQ(locator.static_peers().size(), 1u);
  EXPECT_EQ(locator.static_peers()[0].port, 4001);
}

TEST_F(CLITest, StoppedShellRunsNoFurtherCommands) {
  std::istringstream in("stats\nls\n");
  std::ostringstream out;
  cli::CLI shell(in, out, *node, locator);

  shell.stop();
  shell.run();

  EXPECT_EQ(out.str().find("Stored fragments"), std::string::npos);
  EXPECT_EQ(out.str().find("No files uploaded"), std::string::npos);
}

TEST_F(CLITest, StopWaitsForRunningCommand) {
  std::istringstream in("quit\n");
  std::ostringstream out;
  std::atomic<bool> quit_finished{false};
  std::unique_ptr<cli::CLI> shell;

  // The quit callback runs inside the command, stop() from another thread must wait for it
  std::thread stopper;
  shell = std::make_unique<cli::CLI>(in, out, *node, locator, [&]() {
    stopper = std::thread([&]() {
      shell->stop();
      EXPECT_TRUE(quit_finished.load());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    quit_finished = true;
  });

  shell->run();
  stopper.join();
}

TEST_F(CLITest, QuitStopsLoopAndNotifies) {
  bool quit_called = false;
  const auto output = run_script("quit\nls\n", &quit_called);

  EXPECT_TRUE(quit_called);
  EXPECT_EQ(output.find("No files uploaded"), std::string::npos);
}
