#include <gtest/gtest.h>
#include <thread>
#include "kernel/errors.hpp"
#include "kernel/session_table.hpp"

using namespace royaos::kernel;
using namespace std::chrono_literals;

TEST(SessionTable, CreateAndGet)
{
  SessionTable table;
  auto session = table.create({{"client", "agent-1"}});

  EXPECT_EQ(session.id.rfind("sess-", 0), 0u);
  EXPECT_EQ(session.status, SessionStatus::ACTIVE);

  auto found = table.get(session.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->metadata.at("client"), "agent-1");
  EXPECT_EQ(table.size(), 1u);
  EXPECT_FALSE(table.get("sess-unknown").has_value());
}

TEST(SessionTable, SessionIdsAreUnique)
{
  SessionTable table;
  auto a = table.create({});
  auto b = table.create({});
  EXPECT_NE(a.id, b.id);
  EXPECT_EQ(table.list().size(), 2u);
}

TEST(SessionTable, OwnershipIsExclusive)
{
  SessionTable table;
  auto a = table.create({});
  auto b = table.create({});

  {
    auto txn = table.begin();
    txn.own(txn.active(a.id), "mem-1");
    EXPECT_EQ(txn.owner_of("mem-1"), a.id);
    EXPECT_THROW(txn.own(txn.active(b.id), "mem-1"), InvariantViolation);
  }

  EXPECT_TRUE(table.get(a.id)->owns("mem-1"));
  EXPECT_FALSE(table.get(b.id)->owns("mem-1"));

  {
    auto txn = table.begin();
    EXPECT_EQ(txn.disown("mem-1"), a.id);
    EXPECT_FALSE(txn.disown("mem-1").has_value());
  }
  EXPECT_FALSE(table.get(a.id)->owns("mem-1"));
}

TEST(SessionTable, CloseLifecycle)
{
  SessionTable table;
  auto session = table.create({});
  {
    auto txn = table.begin();
    txn.own(txn.active(session.id), "mem-1");
    txn.own(txn.active(session.id), "mem-2");
  }

  auto handles = table.begin_close(session.id);
  EXPECT_EQ(handles.size(), 2u);
  EXPECT_EQ(table.get(session.id)->status, SessionStatus::CLOSING);
  EXPECT_TRUE(table.active_ids().empty());
  EXPECT_EQ(table.live_ids().size(), 1u);

  // Closing sessions accept no new work
  {
    auto txn = table.begin();
    try {
      txn.active(session.id);
      FAIL() << "expected KernelError";
    } catch (const KernelError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::SESSION_NOT_FOUND);
    }
  }
  EXPECT_THROW(table.begin_close(session.id), KernelError);

  auto closed = table.finish_close(session.id);
  EXPECT_EQ(closed.status, SessionStatus::CLOSED);
  EXPECT_TRUE(closed.owned_handles.empty());
  EXPECT_EQ(table.size(), 0u);
  EXPECT_FALSE(table.begin().owner_of("mem-2").has_value());
}

TEST(SessionTable, FinishCloseRequiresClosing)
{
  SessionTable table;
  auto session = table.create({});
  EXPECT_THROW(table.finish_close(session.id), InvariantViolation);
}

TEST(SessionTable, WaitUntilEmpty)
{
  SessionTable table;
  auto session = table.create({});
  table.begin_close(session.id);

  EXPECT_FALSE(table.wait_until_empty(10ms));

  std::thread closer([&] {
    std::this_thread::sleep_for(20ms);
    table.finish_close(session.id);
  });
  EXPECT_TRUE(table.wait_until_empty(5s));
  closer.join();
}
