#include <gtest/gtest.h>
#include "ipc/protocol.hpp"
#include "kernel/errors.hpp"

using namespace royaos;
using json = nlohmann::json;

TEST(Protocol, FrameHeader)
{
  ipc::Message msg(R"({"session_id":"s"})");
  auto wire = msg.serialize();
  ASSERT_EQ(wire.size(), ipc::HEADER_SIZE + msg.payload.size());

  auto size = ipc::Message::get_message_size(wire.data(), wire.size());
  ASSERT_TRUE(size.has_value());
  EXPECT_EQ(*size, wire.size());

  auto decoded = ipc::Message::deserialize(wire.data(), wire.size());
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->payload_str(), msg.payload_str());
}

TEST(Protocol, IncompleteAndCorruptFrames)
{
  ipc::Message msg("payload");
  auto wire = msg.serialize();

  EXPECT_FALSE(ipc::Message::get_message_size(wire.data(), ipc::HEADER_SIZE - 1).has_value());
  EXPECT_FALSE(ipc::Message::deserialize(wire.data(), wire.size() - 1).has_value());

  wire[0] ^= 0xFF;
  EXPECT_FALSE(ipc::Message::get_message_size(wire.data(), wire.size()).has_value());
}

TEST(Protocol, OversizedPayloadRejected)
{
  ipc::MessageHeader header;
  header.magic = ipc::MAGIC_BYTES;
  header.payload_size = ipc::MAX_PAYLOAD_SIZE + 1;
  uint8_t raw[ipc::HEADER_SIZE];
  std::memcpy(raw, &header, ipc::HEADER_SIZE);
  EXPECT_FALSE(ipc::Message::get_message_size(raw, sizeof(raw)).has_value());
}

TEST(Protocol, RequestFromJson)
{
  auto req = ipc::Request::from_json({
    {"id", "r1"},
    {"type", "memory/allocate"},
    {"parameters", {{"size_bytes", 16}}},
    {"timestamp", 1700000000000ull}
  });
  EXPECT_EQ(req.id, "r1");
  EXPECT_EQ(req.type, "memory/allocate");
  EXPECT_EQ(req.parameters["size_bytes"], 16);
  EXPECT_EQ(req.timestamp, 1700000000000ull);

  auto bare = ipc::Request::from_json({{"type", "system_info"}});
  EXPECT_TRUE(bare.parameters.is_object());
  EXPECT_TRUE(bare.parameters.empty());
}

TEST(Protocol, MalformedRequests)
{
  EXPECT_THROW(ipc::Request::from_json(json::array()), kernel::KernelError);
  EXPECT_THROW(ipc::Request::from_json({{"id", "r1"}}), kernel::KernelError);
  EXPECT_THROW(ipc::Request::from_json({{"type", 7}}), kernel::KernelError);
  EXPECT_THROW(ipc::Request::from_json({{"type", "system_info"}, {"parameters", "x"}}),
               kernel::KernelError);
}

TEST(Protocol, ResponseEnvelope)
{
  auto ok = ipc::Response::ok("r1", {{"value", 1}}).to_json();
  EXPECT_EQ(ok["id"], "r1");
  EXPECT_EQ(ok["success"], true);
  EXPECT_EQ(ok["data"]["value"], 1);
  EXPECT_FALSE(ok.contains("error"));
  EXPECT_GT(ok["timestamp"].get<uint64_t>(), 0u);

  auto failed = ipc::Response::failure("r2", kernel::ErrorKind::QUOTA_EXCEEDED, "too big").to_json();
  EXPECT_EQ(failed["success"], false);
  EXPECT_EQ(failed["error"]["kind"], "QuotaExceeded");
  EXPECT_EQ(failed["error"]["message"], "too big");
  EXPECT_FALSE(failed.contains("data"));
}
