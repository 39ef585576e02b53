#include <catch2/catch.hpp>

#include "devices/session.hpp"
#include "FakeChannel.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace cavro;
using namespace cavro::test;

TEST_CASE("connect adopts the first endpoint that answers", "[Session]")
{
   FakeChannelFactory factory;
   auto silent = factory.add("/dev/ttyS0");
   auto pump = factory.add("/dev/ttyUSB0");
   pump->queue(reply(0x60));

   Session session(Address::ADDR_0);
   REQUIRE(session.connect(factory).ok());

   CHECK(session.is_connected());
   CHECK(session.state() == SessionState::CONNECTED);
   CHECK(session.endpoint() == "/dev/ttyUSB0");

   CHECK(silent->open_count == 1);
   CHECK(silent->close_count == 1);
   CHECK_FALSE(silent->is_open);
   CHECK(silent->written == std::vector<std::string>{"/1Q\r"});

   CHECK(pump->is_open);
   CHECK(pump->flush_count == 1);
   CHECK(pump->timeout_ms == Protocol::READ_TIMEOUT_MS);
}

TEST_CASE("connect accepts a busy or error reply as long as it decodes", "[Session]")
{
   FakeChannelFactory factory;
   auto pump = factory.add("/dev/ttyUSB0");
   pump->queue(reply(0x47));

   Session session(Address::ADDR_0);
   CHECK(session.connect(factory).ok());
}

TEST_CASE("connect skips endpoints with undecodable replies", "[Session]")
{
   FakeChannelFactory factory;
   auto modem = factory.add("/dev/ttyS0");
   modem->queue(Bytes{'O', 'K'});
   auto other = factory.add("/dev/ttyS1");
   other->queue(reply(0x20));
   auto pump = factory.add("/dev/ttyUSB0");
   pump->queue(reply(0x60));

   Session session(Address::ADDR_0);
   REQUIRE(session.connect(factory).ok());
   CHECK(session.endpoint() == "/dev/ttyUSB0");
   CHECK_FALSE(modem->is_open);
   CHECK_FALSE(other->is_open);
}

TEST_CASE("connect fails with DEVICE_NOT_FOUND and leaves nothing open", "[Session]")
{
   FakeChannelFactory factory;
   auto a = factory.add("/dev/ttyS0");
   auto b = factory.add("/dev/ttyS1");
   b->open_fails = true;

   Session session(Address::ADDR_0);
   auto r = session.connect(factory);
   REQUIRE_FALSE(r.ok());
   CHECK(r.error() == Error::DEVICE_NOT_FOUND);
   CHECK(session.state() == SessionState::DISCONNECTED);
   CHECK_FALSE(a->is_open);
   CHECK_FALSE(b->is_open);
   CHECK(b->open_count == 0);
}

TEST_CASE("connect with no endpoints fails", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto r = session.connect(factory);
   REQUIRE_FALSE(r.ok());
   CHECK(r.error() == Error::DEVICE_NOT_FOUND);
}

TEST_CASE("connect is a no-op when already connected", "[Session]")
{
   FakeChannelFactory factory;
   auto pump = factory.add("/dev/ttyUSB0");
   pump->queue(reply(0x60));

   Session session(Address::ADDR_0);
   REQUIRE(session.connect(factory).ok());
   REQUIRE(session.connect(factory).ok());
   CHECK(factory.created() == 1);
   CHECK(pump->written.size() == 1);
}

TEST_CASE("connect_to tries only the named endpoint", "[Session]")
{
   FakeChannelFactory factory;
   auto first = factory.add("/dev/ttyS0");
   first->queue(reply(0x60));
   auto pump = factory.add("/dev/ttyUSB3");
   pump->queue(reply(0x60));

   Session session(Address::ADDR_2);
   REQUIRE(session.connect_to(factory, "/dev/ttyUSB3").ok());
   CHECK(first->open_count == 0);
   CHECK(pump->written == std::vector<std::string>{"/3Q\r"});

   Session missing(Address::ADDR_0);
   auto r = missing.connect_to(factory, "/dev/ttyUSB9");
   REQUIRE_FALSE(r.ok());
   CHECK(r.error() == Error::DEVICE_NOT_FOUND);
}

TEST_CASE("disconnect closes the channel and is idempotent", "[Session]")
{
   FakeChannelFactory factory;
   auto pump = factory.add("/dev/ttyUSB0");
   pump->queue(reply(0x60));

   Session session(Address::ADDR_0);
   REQUIRE(session.connect(factory).ok());

   session.disconnect();
   CHECK(session.state() == SessionState::DISCONNECTED);
   CHECK_FALSE(pump->is_open);
   CHECK(pump->close_count == 1);

   session.disconnect();
   CHECK(pump->close_count == 1);

   auto r = session.transact(cmd::QueryStatus{});
   REQUIRE_FALSE(r.ok());
   CHECK(r.error() == Error::NOT_CONNECTED);
}

TEST_CASE("transact before connect fails", "[Session]")
{
   Session session(Address::ADDR_0);
   auto r = session.transact(cmd::QueryStatus{});
   REQUIRE_FALSE(r.ok());
   CHECK(r.error() == Error::NOT_CONNECTED);

   auto w = session.wait_for_ready();
   REQUIRE_FALSE(w.ok());
   CHECK(w.error() == Error::NOT_CONNECTED);
}

namespace {

std::shared_ptr<FakeLine> connected(FakeChannelFactory& factory, Session& session)
{
   auto line = factory.add("/dev/ttyUSB0");
   line->queue(reply(0x60));
   session.set_poll_interval_ms(0);
   REQUIRE(session.connect(factory).ok());
   line->written.clear();
   return line;
}

} // namespace

TEST_CASE("wait_for_ready polls until the ready nibble appears", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);

   line->queue(reply(0x40));
   line->queue(reply(0x40));
   line->queue(reply(0x60));

   REQUIRE(session.wait_for_ready().ok());
   CHECK(line->bodies() == std::vector<std::string>{"Q", "Q", "Q"});
}

TEST_CASE("wait_for_ready ignores error codes on a ready reply", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);

   line->queue(reply(0x69));
   CHECK(session.wait_for_ready().ok());
}

TEST_CASE("wait_for_ready surfaces transport timeouts", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);

   line->queue(reply(0x40));
   line->queue_timeout();

   auto r = session.wait_for_ready();
   REQUIRE_FALSE(r.ok());
   CHECK(r.error() == Error::TIMEOUT);
}

TEST_CASE("wait_for_ready honours a wait budget", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);

   line->when_empty = reply(0x40);
   session.set_poll_interval_ms(5);
   session.set_max_wait_ms(30);

   auto r = session.wait_for_ready();
   REQUIRE_FALSE(r.ok());
   CHECK(r.error() == Error::WAIT_TIMEOUT);
   CHECK(line->written.size() >= 2);
}

TEST_CASE("cancel stops the poll loop until disconnect", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);

   line->when_empty = reply(0x60);
   session.cancel();

   auto r = session.wait_for_ready();
   REQUIRE_FALSE(r.ok());
   CHECK(r.error() == Error::CANCELLED);
   CHECK(line->written.empty());

   session.disconnect();
   CHECK_FALSE(session.is_cancelled());
}

TEST_CASE("cancel from another thread ends a wait in progress", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);

   line->when_empty = reply(0x40);
   session.set_poll_interval_ms(5);

   Result<bool> result = Result<bool>::failure(Error::TIMEOUT);
   std::thread waiter([&session, &result]() { result = session.wait_for_ready(); });

   std::this_thread::sleep_for(std::chrono::milliseconds(30));
   session.cancel();
   waiter.join();

   REQUIRE_FALSE(result.ok());
   CHECK(result.error() == Error::CANCELLED);
}

TEST_CASE("clear_cancel lets the next wait run", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);

   line->when_empty = reply(0x60);
   session.cancel();
   REQUIRE_FALSE(session.wait_for_ready().ok());

   session.clear_cancel();
   CHECK_FALSE(session.is_cancelled());
   CHECK(session.wait_for_ready().ok());
   CHECK(line->bodies() == std::vector<std::string>{"Q"});
}

TEST_CASE("read timeout change reaches the connected channel", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);
   CHECK(line->read_timeout_ms == Protocol::READ_TIMEOUT_MS);

   session.set_read_timeout_ms(2000);
   line->queue(reply(0x60));
   REQUIRE(session.transact(cmd::QueryStatus{}).ok());
   CHECK(line->read_timeout_ms == 2000);
}

TEST_CASE("initialize resends Z after DeviceNotInitialized", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);

   line->queue(reply(0x60));   // Q
   line->queue(reply(0x47));   // Z: not initialized
   line->queue(reply(0x40));   // Q: busy
   line->queue(reply(0x60));   // Q
   line->queue(reply(0x60));   // Z

   auto r = session.initialize();
   REQUIRE(r.ok());
   CHECK(r.value() == ErrorCode::NO_ERROR);
   CHECK(line->bodies() == std::vector<std::string>{"Q", "Z0,0,0R", "Q", "Q", "Z0,0,0R"});
}

TEST_CASE("initialize returns other statuses without retrying", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);

   line->queue(reply(0x60));
   line->queue(reply(0x66));

   auto r = session.initialize();
   REQUIRE(r.ok());
   CHECK(r.value() == ErrorCode::EEPROM_FAILURE);
   CHECK(line->bodies() == std::vector<std::string>{"Q", "Z0,0,0R"});
}

TEST_CASE("initialize attempt bound", "[Session]")
{
   FakeChannelFactory factory;
   Session session(Address::ADDR_0);
   auto line = connected(factory, session);

   session.set_max_initialize_attempts(2);
   for (int i = 0; i < 2; ++i) {
      line->queue(reply(0x60));
      line->queue(reply(0x67));
   }

   auto r = session.initialize();
   REQUIRE_FALSE(r.ok());
   CHECK(r.error() == Error::DEVICE_ERROR);
   CHECK(r.device_status() == ErrorCode::DEVICE_NOT_INITIALIZED);
   CHECK(line->written.size() == 4);
}

TEST_CASE("log callback sees frames as hex", "[Session]")
{
   FakeChannelFactory factory;
   auto line = factory.add("/dev/ttyUSB0");
   line->queue(reply(0x60));

   std::vector<std::string> lines;
   Session session(Address::ADDR_0);
   session.set_log_callback([&lines](const std::string& msg) { lines.push_back(msg); });
   REQUIRE(session.connect(factory).ok());

   REQUIRE(lines.size() >= 2);
   CHECK(lines[0] == "[TX] 2F 31 51 0D");
   CHECK(lines[1] == "[RX] 2F 30 60");

   session.set_log_callback(nullptr);
}
