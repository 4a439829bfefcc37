#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>
#include "network/codec.hpp"
#include "network/network_error.hpp"
#include "network/tcp_server.hpp"
#include "test_utils.hpp"

using namespace fragnet::network;

namespace {
const std::string ECHO_PROTOCOL = "/test/echo/1.0.0";
}

class TCPServerTest : public ::testing::Test {
protected:
  std::unique_ptr<TCP_Server> server;
  std::unique_ptr<TCP_Server> client;

  void SetUp() override {
    init_test_logging(boost::log::trivial::fatal);
    server = std::make_unique<TCP_Server>(0, "127.0.0.1", std::chrono::milliseconds(2000), 8);
    client = std::make_unique<TCP_Server>(0, "127.0.0.1", std::chrono::milliseconds(2000), 2);
  }

  void TearDown() override {
    if (server) {
      server->shutdown();
    }
  }

  void register_echo() {
    server->set_handler(ECHO_PROTOCOL, [](Stream& stream) {
      stream.write_frame(stream.read_frame());
    });
  }
};

TEST_F(TCPServerTest, StartListenerBindsEphemeralPort) {
  ASSERT_TRUE(server->start_listener());
  EXPECT_TRUE(server->is_running());
  EXPECT_NE(server->local_port(), 0);
  EXPECT_EQ(server->local_address().host, "127.0.0.1");
}

TEST_F(TCPServerTest, MultipleStartFails) {
  ASSERT_TRUE(server->start_listener());
  EXPECT_FALSE(server->start_listener());
}

TEST_F(TCPServerTest, RestartAfterShutdown) {
  ASSERT_TRUE(server->start_listener());
  server->shutdown();
  EXPECT_FALSE(server->is_running());

  EXPECT_TRUE(server->start_listener());
}

TEST_F(TCPServerTest, HandshakeDispatchesToHandler) {
  register_echo();
  ASSERT_TRUE(server->start_listener());

  auto stream = client->open_stream(server->local_address(), ECHO_PROTOCOL);
  const auto payload = random_bytes(100 * 1024);
  stream->write_frame(payload);
  EXPECT_EQ(stream->read_frame(), payload);
  stream->close();
}

TEST_F(TCPServerTest, EmptyFrameIsDelivered) {
  register_echo();
  ASSERT_TRUE(server->start_listener());

  auto stream = client->open_stream(server->local_address(), ECHO_PROTOCOL);
  stream->write_frame(Bytes{});
  EXPECT_TRUE(stream->read_frame().empty());
}

TEST_F(TCPServerTest, UnknownProtocolClosesStream) {
  register_echo();
  ASSERT_TRUE(server->start_listener());

  auto stream = client->open_stream(server->local_address(), "/test/unknown/1.0.0");
  EXPECT_THROW(stream->read_frame(), NetworkException);
}

TEST_F(TCPServerTest, HandlerExceptionDoesNotStopServer) {
  server->set_handler("/test/throw/1.0.0", [](Stream&) {
    throw std::runtime_error("handler failure");
  });
  register_echo();
  ASSERT_TRUE(server->start_listener());

  auto failing = client->open_stream(server->local_address(), "/test/throw/1.0.0");
  EXPECT_THROW(failing->read_frame(), NetworkException);

  auto stream = client->open_stream(server->local_address(), ECHO_PROTOCOL);
  stream->write_frame(Bytes{1, 2, 3});
  EXPECT_EQ(stream->read_frame(), (Bytes{1, 2, 3}));
}

TEST_F(TCPServerTest, HandlersRunConcurrently) {
  const int num_streams = 4;
  std::mutex mutex;
  std::condition_variable cv;
  int active = 0;

  // Each handler waits until every stream is inside a handler at the same time
  server->set_handler(ECHO_PROTOCOL, [&](Stream& stream) {
    Bytes frame = stream.read_frame();
    {
      std::unique_lock<std::mutex> lock(mutex);
      ++active;
      cv.notify_all();
      if (!cv.wait_for(lock, std::chrono::seconds(5), [&] { return active >= num_streams; })) {
        return;
      }
    }
    stream.write_frame(frame);
  });
  ASSERT_TRUE(server->start_listener());

  std::atomic<int> successes{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < num_streams; ++i) {
    threads.emplace_back([this, i, &successes]() {
      try {
        auto stream = client->open_stream(server->local_address(), ECHO_PROTOCOL);
        Bytes frame(1, static_cast<uint8_t>(i));
        stream->write_frame(frame);
        if (stream->read_frame() == frame) {
          ++successes;
        }
      } catch (const std::exception& e) {
        ADD_FAILURE() << "Stream " << i << " failed: " << e.what();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successes.load(), num_streams);
}

TEST_F(TCPServerTest, StreamsBeyondWorkerCountAreQueued) {
  TCP_Server small(0, "127.0.0.1", std::chrono::milliseconds(3000), 2);
  small.set_handler(ECHO_PROTOCOL, [](Stream& stream) {
    Bytes frame = stream.read_frame();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    stream.write_frame(frame);
  });
  ASSERT_TRUE(small.start_listener());

  const int num_streams = 5;
  std::atomic<int> successes{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < num_streams; ++i) {
    threads.emplace_back([this, i, &small, &successes]() {
      try {
        auto stream = client->open_stream(small.local_address(), ECHO_PROTOCOL);
        Bytes frame(1, static_cast<uint8_t>(i));
        stream->write_frame(frame);
        if (stream->read_frame() == frame) {
          ++successes;
        }
      } catch (const std::exception& e) {
        ADD_FAILURE() << "Stream " << i << " failed: " << e.what();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successes.load(), num_streams);
  small.shutdown();
}

TEST_F(TCPServerTest, OpenStreamToClosedPortThrows) {
  ASSERT_TRUE(server->start_listener());
  const auto address = server->local_address();
  server->shutdown();

  EXPECT_THROW(client->open_stream(address, ECHO_PROTOCOL), PeerUnreachableError);
}

TEST_F(TCPServerTest, SilentPeerTimesOut) {
  TCP_Server quick(0, "127.0.0.1", std::chrono::milliseconds(200), 1);
  server->set_handler(ECHO_PROTOCOL, [](Stream& stream) {
    stream.read_frame();
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
  });
  ASSERT_TRUE(server->start_listener());

  auto stream = quick.open_stream(server->local_address(), ECHO_PROTOCOL);
  stream->write_frame(Bytes{1});
  EXPECT_THROW(stream->read_frame(), TimeoutError);
}
