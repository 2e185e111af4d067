#include "Messenger.h"
#include "util.h"
#include <loguru/loguru.hpp>

/* low-level networking */
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

/* general */
#include <cerrno>
#include <cstring>
#include <thread>
#include <unistd.h>

/* loguru priority: logs to file, not to stderr. */
const int LOG_PRIORITY = 4;

/* Frames longer than this are treated as a broken connection. */
const uint32_t MAX_FRAME_LENGTH = 64 * 1024 * 1024;

const int LISTEN_BACKLOG = 20;

/**
 * ~~~~~~ Wire and threading notes ~~~~~~
 *
 * Framing: every message travels as a 4 byte big-endian length followed by
 * that many bytes.
 *
 * Every connection has two detached workers, a receiver and a sender. The
 * first worker to see the connection fail marks it half closed and wakes its
 * partner (shutdown() for a receiver stuck in recv, an empty frame for a
 * sender stuck on its outbox). The second one closes the fd and forgets the
 * connection.
 *
 * The destructor closes every fd to wake the workers, so a worker may still
 * touch an fd number that was reused afterwards. Messengers live as long as
 * the process.
 *
 * ~~~~~~ Wire and threading notes ~~~~~~
 */

namespace {

bool writeAll(int fd, const char *buf, size_t length) {
    size_t written = 0;
    while (written < length) {
        // MSG_NOSIGNAL: a dead peer gives EPIPE instead of SIGPIPE
        ssize_t n = send(fd, buf + written, length - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += n;
    }
    return true;
}

bool readAll(int fd, char *buf, size_t length) {
    size_t got = 0;
    while (got < length) {
        ssize_t n = recv(fd, buf + got, length - got, 0);
        if (n < 0 && errno == EINTR) continue;
        // orderly shutdown or error
        if (n <= 0) return false;
        got += n;
    }
    return true;
}

/**
 * Read one length-prefixed frame. Returns a null option once the connection
 * is unusable.
 */
std::optional<std::string> readFrame(int fd) {
    uint32_t lengthBE;
    if (!readAll(fd, reinterpret_cast<char *>(&lengthBE), sizeof(lengthBE))) {
        return std::nullopt;
    }
    uint32_t length = ntohl(lengthBE);
    if (length > MAX_FRAME_LENGTH) {
        VLOG_F(LOG_PRIORITY, "socket %d: frame of %u bytes is too long",
            fd, length);
        return std::nullopt;
    }

    std::string frame(length, '\0');
    if (length > 0 && !readAll(fd, &frame[0], length)) return std::nullopt;
    return frame;
}

bool writeFrame(int fd, const std::string &frame) {
    uint32_t lengthBE = htonl(static_cast<uint32_t>(frame.size()));
    return writeAll(fd, reinterpret_cast<const char *>(&lengthBE),
                    sizeof(lengthBE)) &&
           writeAll(fd, frame.data(), frame.size());
}

/**
 * Open an IPv4 socket listening on every local address at 'port' (host byte
 * order). Throws a Messenger::Exception on failure.
 */
int openListener(int port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw Messenger::Exception(std::string("fatal error: socket() failed: ")
                                   + strerror(errno));
    }
    auto failure = [fd, port](const char *call) {
        std::string msg = std::string("fatal error: ") + call +
            " failed on port " + std::to_string(port) + ": " + strerror(errno);
        close(fd);
        return Messenger::Exception(msg);
    };

    // allow quick restarts on the same port
    int enable = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        throw failure("setsockopt()");
    }

    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        throw failure("bind()");
    }
    if (listen(fd, LISTEN_BACKLOG) < 0) throw failure("listen()");
    return fd;
}

/**
 * Connect to "<IPv4>:<port>" or "[<IPv6>]:<port>". Returns the connected fd,
 * or -1.
 */
int connectTo(const std::string &peerAddr) {
    std::optional<std::string> addr = parseSocketAddress(peerAddr);
    if (!addr) {
        VLOG_F(LOG_PRIORITY, "bad address: %s", peerAddr.c_str());
        return -1;
    }
    std::string host = addr->substr(0, addr->rfind(':'));
    uint16_t port = static_cast<uint16_t>(parsePort(*addr));

    sockaddr_storage ss;
    memset(&ss, 0, sizeof(ss));
    socklen_t ssLength;
    if (host.front() == '[') {
        sockaddr_in6 *sin6 = reinterpret_cast<sockaddr_in6 *>(&ss);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        std::string ip = host.substr(1, host.size() - 2);
        if (inet_pton(AF_INET6, ip.c_str(), &sin6->sin6_addr) != 1) return -1;
        ssLength = sizeof(sockaddr_in6);
    } else {
        sockaddr_in *sin = reinterpret_cast<sockaddr_in *>(&ss);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        if (inet_pton(AF_INET, host.c_str(), &sin->sin_addr) != 1) return -1;
        ssLength = sizeof(sockaddr_in);
    }

    int fd = socket(ss.ss_family, SOCK_STREAM, 0);
    if (fd < 0) {
        VLOG_F(LOG_PRIORITY, "socket() failed: %s", strerror(errno));
        return -1;
    }
    if (connect(fd, reinterpret_cast<sockaddr *>(&ss), ssLength) < 0) {
        VLOG_F(LOG_PRIORITY, "connect() to %s failed: %s", peerAddr.c_str(),
            strerror(errno));
        close(fd);
        return -1;
    }
    return fd;
}

} // namespace


/**
 * Node instance: accept peers' connections on 'listenPort' (host byte order).
 * Throws a Messenger::Exception if the port cannot be bound.
 */
Messenger::Messenger(const int listenPort) {
    _listenSock = openListener(listenPort);
    VLOG_F(LOG_PRIORITY, "listening socket is %d", *_listenSock);
    std::thread(&Messenger::acceptLoop, this).detach();
}

/* Client instance: sends requests only. */
Messenger::Messenger() {}

Messenger::~Messenger() {
    // wakes the accept loop, which then exits
    if (_listenSock) close(*_listenSock);

    std::lock_guard<std::mutex> lock(_m);
    for (auto &[sockfd, conn] : _connections) {
        close(sockfd);
        conn->closedByOwner = true;
    }
}


/**
 * Accept connections until the listening socket is closed.
 */
void Messenger::acceptLoop() {
    loguru::set_thread_name("listener");
    for (;;) {
        int sockfd = accept(*_listenSock, nullptr, nullptr);
        if (sockfd == -1) {
            if (errno == EBADF) {
                VLOG_F(LOG_PRIORITY, "listening socket closed; accept loop "
                    "exiting");
                return;
            }
            VLOG_F(LOG_PRIORITY, "accept(): %s", strerror(errno));
            continue;
        }
        VLOG_F(LOG_PRIORITY, "accepted connection on socket %d", sockfd);

        std::lock_guard<std::mutex> lock(_m);
        auto conn = std::make_unique<Connection>();
        conn->opened = steady_clock::now();
        _connections[sockfd] = std::move(conn);
        spawnWorkers(sockfd, true);
    }
}

/**
 * Start the receiver and sender of a new connection. 'inbound' connections
 * carry requests in and responses out; outbound ones the reverse. Called
 * with '_m' held, after the connection's state is in '_connections'.
 */
void Messenger::spawnWorkers(int sockfd, bool inbound) {
    std::thread(&Messenger::receiverTask, this, sockfd, inbound).detach();
    std::thread(&Messenger::senderTask, this, sockfd).detach();
}


/**
 * Receiver worker: queue every frame read from 'sockfd' as a Request
 * (inbound) or a Response (outbound) until the connection fails.
 */
void Messenger::receiverTask(int sockfd, bool inbound) {
    std::string peerAddr;
    {
        std::lock_guard<std::mutex> lock(_m);
        peerAddr = _connections.at(sockfd)->peerAddr;
    }

    while (std::optional<std::string> frame = readFrame(sockfd)) {
        if (inbound) {
            _requestQueue.push(
                Request(std::move(*frame), sockfd, steady_clock::now(), *this));
        } else {
            _responseQueue.push({peerAddr, std::move(*frame)});
        }
    }

    workerExiting(sockfd, "receiver");
}


/**
 * Sender worker: write queued frames to 'sockfd' until the connection fails
 * or the receiver gives up on it.
 */
void Messenger::senderTask(int sockfd) {
    BlockingQueue<std::string> *outbox;
    {
        std::lock_guard<std::mutex> lock(_m);
        outbox = &_connections.at(sockfd)->outbox;
    }

    for (;;) {
        std::string frame = outbox->waitingPop();
        {
            std::lock_guard<std::mutex> lock(_m);
            if (_connections.at(sockfd)->halfClosed) break;
        }
        if (!writeFrame(sockfd, frame)) break;
    }

    workerExiting(sockfd, "sender");
}


/**
 * Called by each worker of 'sockfd' as it exits. The first one wakes up its
 * partner; the second one closes the socket and erases its state.
 */
void Messenger::workerExiting(int sockfd, const char *worker) {
    std::lock_guard<std::mutex> lock(_m);
    Connection &conn = *_connections.at(sockfd);
    if (!conn.halfClosed) {
        conn.halfClosed = true;
        conn.outbox.push("");
        shutdown(sockfd, SHUT_RDWR);
        VLOG_F(LOG_PRIORITY, "%s: socket %d half closed", worker, sockfd);
        return;
    }

    if (!conn.closedByOwner) close(sockfd);
    if (!conn.peerAddr.empty()) _peerConnections.erase(conn.peerAddr);
    _connections.erase(sockfd);
    VLOG_F(LOG_PRIORITY, "%s: cleaned up socket %d", worker, sockfd);
}


/**
 * Queue 'message' for the peer at 'peerAddr' ("<IPv4>:<port>" or
 * "[<IPv6>]:<port>"), connecting first if there is no open connection to it.
 *
 * Returns false if no connection could be made. A true return means the
 * message was queued; delivery is best effort.
 *
 * The lock is released while connecting, so a slow peer does not hold up
 * requests to the others.
 */
bool Messenger::sendRequest(const std::string &peerAddr,
                            const std::string &message) {
    std::unique_lock<std::mutex> lock(_m);
    if (!_peerConnections.count(peerAddr)) {
        lock.unlock();
        int sockfd = connectTo(peerAddr);
        if (sockfd == -1) return false;
        lock.lock();

        // CASE: another thread connected to this peer in the meantime
        if (_peerConnections.count(peerAddr)) {
            close(sockfd);
        } else {
            VLOG_F(LOG_PRIORITY, "connected to %s on socket %d",
                peerAddr.c_str(), sockfd);
            auto conn = std::make_unique<Connection>();
            conn->peerAddr = peerAddr;
            _connections[sockfd] = std::move(conn);
            _peerConnections[peerAddr] = sockfd;
            spawnWorkers(sockfd, false);
        }
    }

    _connections.at(_peerConnections.at(peerAddr))->outbox.push(message);
    return true;
}


/**
 * Answer this request on the connection it arrived on. May be called more
 * than once. Returns false if that connection has closed since.
 */
bool Messenger::Request::sendResponse(const std::string &message) {
    std::lock_guard<std::mutex> lock(_messengerParent->_m);
    auto it = _messengerParent->_connections.find(_sockfd);
    if (it == _messengerParent->_connections.end() ||
        it->second->opened > _received || it->second->halfClosed) {
        VLOG_F(LOG_PRIORITY, "sendResponse: connection to requester is closed");
        return false;
    }

    it->second->outbox.push(message);
    return true;
}


/**
 * Wait up to 'timeoutMs' milliseconds for a request; forever if negative.
 */
std::optional<Messenger::Request> Messenger::getNextRequest(int timeoutMs) {
    if (timeoutMs < 0) return _requestQueue.waitingPop();
    return _requestQueue.waitingPop_timed(timeoutMs);
}


/**
 * Wait up to 'timeoutMs' milliseconds for a response; forever if negative.
 */
std::optional<Messenger::Response> Messenger::getNextResponse(int timeoutMs) {
    if (timeoutMs < 0) return _responseQueue.waitingPop();
    return _responseQueue.waitingPop_timed(timeoutMs);
}
