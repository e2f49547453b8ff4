#include <gtest/gtest.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>
#include "ipc/socket_server.hpp"
#include "test_helpers.hpp"

using namespace caserun::ipc;

namespace {

int connect_to(const std::string& path) {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

bool write_all(int fd, const std::vector<uint8_t>& bytes) {
    size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = write(fd, bytes.data() + off, bytes.size() - off);
        if (n <= 0) {
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

std::optional<Message> read_frame(int fd) {
    std::vector<uint8_t> buffer;
    uint8_t chunk[4096];
    while (true) {
        auto size = Message::get_message_size(buffer.data(), buffer.size());
        if (size && buffer.size() >= *size) {
            return Message::deserialize(buffer.data(), buffer.size());
        }
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n <= 0) {
            return std::nullopt;
        }
        buffer.insert(buffer.end(), chunk, chunk + n);
    }
}

} // namespace

class SocketServerTest : public ::testing::Test {
protected:
    caserun::testing::TempDir dir;
    std::unique_ptr<SocketServer> server;
    int client = -1;
    int server_side = -1;

    void SetUp() override {
        server = std::make_unique<SocketServer>(dir.sub("test.sock"));
        server->set_handler([](const Message& msg) {
            return Message(msg.client_id, msg.opcode, "re:" + msg.payload_str());
        });
        ASSERT_TRUE(server->init());

        client = connect_to(server->socket_path());
        ASSERT_GE(client, 0);
        ASSERT_TRUE(caserun::testing::wait_until([&] {
            server_side = server->accept_connection();
            return server_side >= 0;
        }));
    }

    void TearDown() override {
        if (client >= 0) {
            close(client);
        }
        server->stop();
    }
};

TEST_F(SocketServerTest, RepliesToFramedRequest) {
    ASSERT_TRUE(write_all(client, Message(0, Opcode::SESSION_GET, std::string("abc")).serialize()));

    ASSERT_TRUE(caserun::testing::wait_until([&] {
        return server->handle_client(server_side) && server->client_wants_write(server_side);
    }));
    ASSERT_TRUE(server->flush_client(server_side));

    auto reply = read_frame(client);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->opcode, Opcode::SESSION_GET);
    EXPECT_EQ(reply->payload_str(), "re:abc");
    EXPECT_EQ(reply->client_id, server->client_id_for_fd(server_side));
    EXPECT_EQ(server->client_count(), 1u);
}

TEST_F(SocketServerTest, PushReachesClientById) {
    uint32_t id = server->client_id_for_fd(server_side);
    ASSERT_NE(id, 0u);

    EXPECT_EQ(server->send_to_client(id, Message(0, Opcode::STREAM_EVENT, std::string("{}"))), server_side);
    EXPECT_EQ(server->send_to_client(id + 100, Message(0, Opcode::STREAM_EVENT, std::string("{}"))), -1);
    ASSERT_TRUE(server->flush_client(server_side));

    auto frame = read_frame(client);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->opcode, Opcode::STREAM_EVENT);
    EXPECT_EQ(frame->client_id, id);
}

TEST_F(SocketServerTest, BadHeaderDropsConnection) {
    auto bytes = Message(0, Opcode::NOOP, std::string("x")).serialize();
    bytes[1] ^= 0x5A;
    ASSERT_TRUE(write_all(client, bytes));

    bool kept = true;
    ASSERT_TRUE(caserun::testing::wait_until([&] {
        kept = server->handle_client(server_side);
        return !kept;
    }));
    server->remove_client(server_side);
    EXPECT_EQ(server->client_count(), 0u);
}

TEST_F(SocketServerTest, ExitClosesAfterFlush) {
    ASSERT_TRUE(write_all(client, Message(0, Opcode::EXIT).serialize()));
    ASSERT_TRUE(caserun::testing::wait_until([&] {
        server->handle_client(server_side);
        return server->client_wants_write(server_side);
    }));
    EXPECT_FALSE(server->flush_client(server_side));

    auto reply = read_frame(client);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->opcode, Opcode::EXIT);
}
