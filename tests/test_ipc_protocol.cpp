#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/tapedeck_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// The server socket is non-blocking, so poll until `count` lines are in.
bool read_until(UnixSocketServer& server, int fd, std::vector<json>& out, size_t count) {
    for (int i = 0; i < 200 && out.size() < count; ++i) {
        if (!server.read_commands(fd, out)) return false;
        if (out.size() < count) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return out.size() >= count;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        auto perms = std::filesystem::status(sock_path).permissions();
        REQUIRE((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none);
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "get-recording-state"}}));

        std::vector<json> received;
        REQUIRE(read_until(server, client_fd, received, 1));
        REQUIRE(received[0]["cmd"] == "get-recording-state");

        REQUIRE(server.send_response(client_fd, {{"success", true}, {"state", "idle"}}));

        json resp;
        REQUIRE(client.recv(resp, 1000) == RecvStatus::Ok);
        REQUIRE(resp["state"] == "idle");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("SeveralRequestsInOneRead") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"cmd", "get-recording-state"}, {"seq", i}}));
        }

        std::vector<json> received;
        REQUIRE(read_until(server, client_fd, received, 5));
        for (int i = 0; i < 5; ++i) {
            REQUIRE(received[i]["seq"] == i);
        }

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ResponsesArriveInOrder") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Both responses land in the client's buffer before the first recv.
        REQUIRE(server.send_response(client_fd, {{"seq", 1}}));
        REQUIRE(server.send_response(client_fd, {{"seq", 2}}));

        json first, second;
        REQUIRE(client.recv(first, 1000) == RecvStatus::Ok);
        REQUIRE(client.recv(second, 1000) == RecvStatus::Ok);
        REQUIRE(first["seq"] == 1);
        REQUIRE(second["seq"] == 2);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("MalformedLineIsDiscarded") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        // Raw socket, so the bytes bypass the client's JSON encoder.
        int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string raw = "not json {{{\n\n{\"cmd\":\"clear-recording\"}\n";
        REQUIRE(::write(fd, raw.data(), raw.size()) == static_cast<ssize_t>(raw.size()));

        std::vector<json> received;
        REQUIRE(read_until(server, client_fd, received, 2));
        REQUIRE(received.size() == 2);
        REQUIRE(received[0].is_discarded());
        REQUIRE(received[1]["cmd"] == "clear-recording");

        ::close(fd);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Client closes connection
        client.close();

        // Server should detect disconnect (read returns false)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::vector<json> cmds;
        REQUIRE_FALSE(server.read_commands(client_fd, cmds));

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientTimesOutWithoutResponse") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json resp;
        REQUIRE(client.recv(resp, 20) == RecvStatus::Timeout);

        server.close_client(client_fd);
        REQUIRE(client.recv(resp, 1000) == RecvStatus::Disconnected);
        server.stop();
    }

    SECTION("ConnectWithoutServerFails") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
    }
}
