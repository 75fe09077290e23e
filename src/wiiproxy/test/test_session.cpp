#include <gtest/gtest.h>

#include <cmath>
#include <map>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "ScriptedTransport.hpp"
#include "wiiproxy/MSPSession.hpp"

using namespace wiiproxy;
using wiiproxy::test::ScriptedTransport;
using wiiproxy::test::reply;

namespace {

class SessionTest : public ::testing::Test {
protected:
  SessionTest() {
    auto owned = std::make_unique<ScriptedTransport>();
    link = owned.get();
    SessionConfig cfg;
    cfg.default_timeout_s = 0.2;
    session = std::make_unique<Session>(std::move(owned), cfg);
  }

  // answers every written frame with the frame registered for its command
  void autoReply(std::map<uint8_t, std::vector<uint8_t>> replies) {
    ScriptedTransport* t = link;
    link->on_write = [t, replies](const std::vector<uint8_t>& frame) {
      auto it = replies.find(frame[4]);
      if (it != replies.end()) t->push(reply(it->first, it->second));
    };
  }

  ScriptedTransport* link = nullptr;
  std::unique_ptr<Session> session;
};

} // namespace

TEST(Session, RequiresTransport) {
  EXPECT_THROW(Session bad(nullptr), std::invalid_argument);
}

TEST_F(SessionTest, ClosedUntilOpened) {
  EXPECT_FALSE(session->isOpen());
  Ident id;
  EXPECT_EQ(session->get(MSP_IDENT, id), Status::SessionClosed);
  std::vector<uint8_t> out;
  EXPECT_EQ(session->request(MSP_IDENT, {}, out, 0.1), Status::SessionClosed);
  U16List rc;
  rc.values = {1500, 1500, 1500, 1500};
  EXPECT_EQ(session->send(MSP_SET_RAW_RC, rc), Status::SessionClosed);
  EXPECT_EQ(link->writes, 0);
}

TEST_F(SessionTest, OpenAndCloseAreIdempotent) {
  ASSERT_EQ(session->open(), Status::Ok);
  ASSERT_EQ(session->open(), Status::Ok);
  EXPECT_TRUE(session->isOpen());
  EXPECT_EQ(link->open_calls, 1);

  session->close();
  session->close();
  EXPECT_FALSE(session->isOpen());
  EXPECT_EQ(link->close_calls, 1);

  Ident id;
  EXPECT_EQ(session->get(MSP_IDENT, id), Status::SessionClosed);
}

TEST_F(SessionTest, OpenFailureIsIoError) {
  link->fail_open = true;
  EXPECT_EQ(session->open(), Status::IoError);
  EXPECT_FALSE(session->isOpen());
}

TEST_F(SessionTest, ReopenAfterClose) {
  autoReply({{MSP_IDENT, {0x17, 3, 0, 0, 0, 0, 0}}});
  ASSERT_EQ(session->open(), Status::Ok);
  session->close();
  ASSERT_EQ(session->open(), Status::Ok);
  EXPECT_EQ(link->open_calls, 2);

  Ident id;
  ASSERT_EQ(session->get(MSP_IDENT, id), Status::Ok);
  EXPECT_EQ(id.version, 23);
}

TEST_F(SessionTest, GetIdent) {
  autoReply({{MSP_IDENT, {0x17, 3, 0, 0, 0, 0, 0}}});
  ASSERT_EQ(session->open(), Status::Ok);
  Ident id;
  ASSERT_EQ(session->get(MSP_IDENT, id), Status::Ok);
  EXPECT_EQ(id.version, 23);
  EXPECT_EQ(id.multitype, MultiType::QuadX);
  EXPECT_EQ(session->counters().frames, 1u);
}

TEST_F(SessionTest, GetTimesOut) {
  ASSERT_EQ(session->open(), Status::Ok);
  Attitude att;
  EXPECT_EQ(session->get(MSP_ATTITUDE, att, 0.02), Status::Timeout);
}

TEST_F(SessionTest, ActionIsAcknowledged) {
  autoReply({{MSP_EEPROM_WRITE, {}}});
  ASSERT_EQ(session->open(), Status::Ok);
  EXPECT_EQ(session->action(MSP_EEPROM_WRITE), Status::Ok);
  EXPECT_EQ(link->tx, (std::vector<uint8_t>{'$', 'M', '<', 0, MSP_EEPROM_WRITE, MSP_EEPROM_WRITE}));
}

TEST_F(SessionTest, SetHeading) {
  autoReply({{MSP_SET_HEAD, {}}});
  ASSERT_EQ(session->open(), Status::Ok);
  Heading h;
  h.heading_deg = 90;
  EXPECT_EQ(session->set(MSP_SET_HEAD, h), Status::Ok);
  ASSERT_EQ(link->tx.size(), 8u);
  EXPECT_EQ(link->tx[5], 90);
  EXPECT_EQ(link->tx[6], 0);
}

TEST_F(SessionTest, QueryWaypoint) {
  std::vector<uint8_t> wp_reply = {3};
  push_u32(wp_reply, static_cast<uint32_t>(473977420));
  push_u32(wp_reply, static_cast<uint32_t>(85456000));
  push_u32(wp_reply, 2500);  // 25 m
  push_u16(wp_reply, 0);
  push_u16(wp_reply, 0);
  wp_reply.push_back(0xA5);
  autoReply({{MSP_WP, wp_reply}});
  ASSERT_EQ(session->open(), Status::Ok);

  WaypointQuery q;
  q.wp_no = 3;
  Waypoint wp;
  ASSERT_EQ(session->query(MSP_WP, q, wp, 0.1), Status::Ok);
  // request carries the waypoint number
  ASSERT_EQ(link->tx.size(), 7u);
  EXPECT_EQ(link->tx[3], 1);
  EXPECT_EQ(link->tx[5], 3);
  EXPECT_EQ(wp.wp_no, 3);
  EXPECT_NEAR(wp.latitude_deg, 47.397742, 1e-9);
  EXPECT_NEAR(wp.alt_hold_m, 25.0, 1e-9);
  EXPECT_EQ(wp.nav_flag, 0xA5);
}

TEST_F(SessionTest, CommandRejected) {
  ASSERT_EQ(session->open(), Status::Ok);
  std::vector<uint8_t> refused;
  buildFrame(MSP_SET_MISC, {}, refused, kDirError);
  ScriptedTransport* t = link;
  link->on_write = [t, refused](const std::vector<uint8_t>&) { t->push(refused); };
  Misc misc;
  EXPECT_EQ(session->set(MSP_SET_MISC, misc), Status::CommandRejected);
}

TEST_F(SessionTest, SendDoesNotWait) {
  ASSERT_EQ(session->open(), Status::Ok);
  U16List rc;
  rc.values = {1500, 1500, 1000, 1500, 1000, 1000, 1000, 1000};
  ASSERT_EQ(session->send(MSP_SET_RAW_RC, rc), Status::Ok);
  EXPECT_EQ(link->writes, 1);
  EXPECT_EQ(link->reads, 0);
  ASSERT_EQ(link->tx.size(), 6u + 16u);
  EXPECT_EQ(link->tx[4], MSP_SET_RAW_RC);

  EXPECT_EQ(session->send(213, rc), Status::UnknownCommand);
  Attitude att;
  EXPECT_EQ(session->send(MSP_SET_RAW_RC, att), Status::SchemaMismatch);
  EXPECT_EQ(link->writes, 1);
}

TEST_F(SessionTest, ConcurrentCallersAreSerialized) {
  autoReply({{MSP_ATTITUDE, {0x83, 0xFF, 0x2D, 0x00, 0x0E, 0x01}},
             {MSP_ALTITUDE, {0x6A, 0xFF, 0xFF, 0xFF, 0x19, 0x00}},
             {MSP_RC, {0xDC, 0x05, 0xE8, 0x03}},
             {MSP_IDENT, {0x17, 3, 0, 0, 0, 0, 0}}});
  ASSERT_EQ(session->open(), Status::Ok);

  const int kRounds = 25;
  std::vector<int> failures(4, 0);
  std::vector<std::thread> threads;
  threads.emplace_back([&] {
    for (int i = 0; i < kRounds; ++i) {
      Attitude att;
      if (session->get(MSP_ATTITUDE, att) != Status::Ok || std::abs(att.roll_deg + 12.5) > 1e-9) ++failures[0];
    }
  });
  threads.emplace_back([&] {
    for (int i = 0; i < kRounds; ++i) {
      Altitude alt;
      if (session->get(MSP_ALTITUDE, alt) != Status::Ok || alt.altitude_m > -1.49) ++failures[1];
    }
  });
  threads.emplace_back([&] {
    for (int i = 0; i < kRounds; ++i) {
      U16List rc;
      if (session->get(MSP_RC, rc) != Status::Ok || rc.values.size() != 2) ++failures[2];
    }
  });
  threads.emplace_back([&] {
    for (int i = 0; i < kRounds; ++i) {
      Ident id;
      if (session->get(MSP_IDENT, id) != Status::Ok || id.version != 23) ++failures[3];
    }
  });
  for (auto& th : threads) th.join();

  EXPECT_EQ(failures, std::vector<int>(4, 0));
  EXPECT_EQ(link->max_concurrency.load(), 1);
  EXPECT_EQ(link->writes, 4 * kRounds);
  EXPECT_EQ(session->counters().frames, 4u * kRounds);
}

TEST_F(SessionTest, CloseDropsPartialInput) {
  autoReply({{MSP_IDENT, {0x17, 3, 0, 0, 0, 0, 0}}});
  ASSERT_EQ(session->open(), Status::Ok);
  // half a frame left on the wire when the link goes down
  link->push({'$', 'M', '>', 7, MSP_IDENT, 0x17});
  Attitude att;
  EXPECT_EQ(session->get(MSP_ATTITUDE, att, 0.02), Status::Timeout);
  session->close();

  ASSERT_EQ(session->open(), Status::Ok);
  Ident id;
  ASSERT_EQ(session->get(MSP_IDENT, id), Status::Ok);
  EXPECT_EQ(id.version, 23);
}
