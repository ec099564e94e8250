#include "PipeSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace cm;

namespace {
// Leaves a socket file behind the way a crashed listener does
void CreateAbandonedSocket(const string& path) {
  int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  sockaddr_un local;
  memset(&local, 0, sizeof(sockaddr_un));
  local.sun_family = AF_UNIX;
  strncpy(local.sun_path, path.c_str(), sizeof(local.sun_path) - 1);
  FATAL_FAIL(::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)));
  FATAL_FAIL(::close(fd));
}

int AcceptOne(shared_ptr<PipeSocketHandler> handler, int serverFd) {
  int fd = -1;
  WaitUntil([&]() {
    if (!handler->waitForData(serverFd, 0, 100 * 1000)) {
      return false;
    }
    fd = handler->accept(serverFd);
    return fd >= 0;
  });
  return fd;
}
}  // namespace

TEST_CASE("Listening is exclusive across handlers", "[PipeSocketHandler]") {
  const string directory = CreateTestDirectory("cm_test_pipe");
  const SocketEndpoint endpoint = MakeEndpoint(directory + "/ipc.socket");
  auto first = make_shared<PipeSocketHandler>();
  auto second = make_shared<PipeSocketHandler>();

  set<int> serverFds = first->listen(endpoint);
  REQUIRE(serverFds.size() == 1);

  set<int> secondFds = second->listen(endpoint);
  int listenErrno = GetErrno();
  REQUIRE(secondFds.empty());
  REQUIRE(listenErrno == EADDRINUSE);

  SECTION("Released on stopListening") {
    first->stopListening(endpoint);
    REQUIRE(!fs::exists(endpoint.name()));
    // The lock file outlives the listener
    REQUIRE(fs::exists(PipeSocketHandler::getLockPath(endpoint.name())));

    REQUIRE(second->listen(endpoint).size() == 1);
    second->stopListening(endpoint);
  }

  SECTION("Listening twice from one handler is a bug") {
    REQUIRE_THROWS_AS(first->listen(endpoint), std::runtime_error);
    first->stopListening(endpoint);
  }

  std::error_code ec;
  fs::remove_all(directory, ec);
}

TEST_CASE("Connect reports why nobody answered", "[PipeSocketHandler]") {
  const string directory = CreateTestDirectory("cm_test_pipe");
  auto handler = make_shared<PipeSocketHandler>();

  SECTION("Missing socket file") {
    int fd = handler->connect(MakeEndpoint(directory + "/missing.socket"));
    int connectErrno = GetErrno();
    REQUIRE(fd < 0);
    REQUIRE(connectErrno == ENOENT);
  }

  SECTION("Abandoned socket file") {
    const string path = directory + "/abandoned.socket";
    CreateAbandonedSocket(path);
    int fd = handler->connect(MakeEndpoint(path));
    int connectErrno = GetErrno();
    REQUIRE(fd < 0);
    REQUIRE(connectErrno == ECONNREFUSED);
  }

  SECTION("Path too long") {
    int fd = handler->connect(MakeEndpoint(directory + "/" + string(200, 'x')));
    int connectErrno = GetErrno();
    REQUIRE(fd < 0);
    REQUIRE(connectErrno == ENAMETOOLONG);
  }

  std::error_code ec;
  fs::remove_all(directory, ec);
}

TEST_CASE("Stale sockets are reclaimed, other files are not",
          "[PipeSocketHandler]") {
  const string directory = CreateTestDirectory("cm_test_pipe");
  auto handler = make_shared<PipeSocketHandler>();

  SECTION("Stale socket") {
    const SocketEndpoint endpoint = MakeEndpoint(directory + "/ipc.socket");
    CreateAbandonedSocket(endpoint.name());
    REQUIRE(handler->listen(endpoint).size() == 1);

    int clientFd = handler->connect(endpoint);
    REQUIRE(clientFd >= 0);
    handler->close(clientFd);
    handler->stopListening(endpoint);
  }

  SECTION("Regular file") {
    const SocketEndpoint endpoint = MakeEndpoint(directory + "/not.socket");
    {
      std::ofstream out(endpoint.name());
      out << "precious";
    }
    set<int> serverFds = handler->listen(endpoint);
    int listenErrno = GetErrno();
    REQUIRE(serverFds.empty());
    REQUIRE(listenErrno == EEXIST);
    REQUIRE(fs::is_regular_file(endpoint.name()));
  }

  std::error_code ec;
  fs::remove_all(directory, ec);
}

TEST_CASE("Frames cross the socket intact", "[PipeSocketHandler]") {
  const string directory = CreateTestDirectory("cm_test_pipe");
  const SocketEndpoint endpoint = MakeEndpoint(directory + "/ipc.socket");
  auto handler = make_shared<PipeSocketHandler>();
  int serverFd = *(handler->listen(endpoint).begin());
  int clientFd = handler->connect(endpoint);
  REQUIRE(clientFd >= 0);
  int acceptedFd = AcceptOne(handler, serverFd);
  REQUIRE(acceptedFd >= 0);

  SECTION("Valid frames then a clean close") {
    handler->writePacket(clientFd, Packet('1', "first"), true);
    handler->writePacket(clientFd, Packet('2', ""), true);
    handler->close(clientFd);

    Packet packet;
    REQUIRE(handler->readPacket(acceptedFd, &packet, true));
    REQUIRE(packet.getHeader() == '1');
    REQUIRE(packet.getPayload() == "first");
    REQUIRE(handler->readPacket(acceptedFd, &packet, true));
    REQUIRE(packet.getHeader() == '2');
    REQUIRE(!handler->readPacket(acceptedFd, &packet, true));
  }

  SECTION("Zero length") {
    int64_t length = 0;
    handler->writeAllOrThrow(clientFd, &length, sizeof(int64_t), true);
    Packet packet;
    REQUIRE_THROWS_AS(handler->readPacket(acceptedFd, &packet, true),
                      std::runtime_error);
    handler->close(clientFd);
  }

  SECTION("Too long") {
    int64_t length = MAX_FRAME_LENGTH + 1;
    handler->writeAllOrThrow(clientFd, &length, sizeof(int64_t), true);
    Packet packet;
    REQUIRE_THROWS_AS(handler->readPacket(acceptedFd, &packet, true),
                      std::runtime_error);
    handler->close(clientFd);
  }

  SECTION("Truncated") {
    int64_t length = 10;
    handler->writeAllOrThrow(clientFd, &length, sizeof(int64_t), true);
    handler->writeAllOrThrow(clientFd, "1abc", 4, true);
    handler->close(clientFd);
    Packet packet;
    REQUIRE_THROWS_AS(handler->readPacket(acceptedFd, &packet, true),
                      std::runtime_error);
  }

  handler->close(acceptedFd);
  handler->stopListening(endpoint);
  std::error_code ec;
  fs::remove_all(directory, ec);
}
