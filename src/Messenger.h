#ifndef MESSENGER_H
#define MESSENGER_H

#include "BlockingQueue.h"
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

using std::unordered_map;
using std::chrono::steady_clock;
using std::chrono::time_point;


/**
 * The Messenger class carries opaque messages between RAFT nodes and clients
 * over TCP, with request/response semantics.
 *
 * A node builds its Messenger with a listen port: peers' requests arrive
 * through getNextRequest() and are answered through Request::sendResponse().
 * Any Messenger can send requests with sendRequest(); the answers arrive
 * through getNextResponse(), tagged with the address they came from.
 */
class Messenger {
    public:
        Messenger(int listenPort); // node instance
        Messenger();               // client instance
        ~Messenger();

        /* a received request. 'sendResponse()' answers on the connection the
           request arrived on */
        struct Request {
            std::string message;
            bool sendResponse(const std::string &responseMessage);

            private:
                Request(std::string m, int sock, time_point<steady_clock> ts,
                        Messenger& mp) : message(std::move(m)), _sockfd(sock),
                        _received(ts), _messengerParent(&mp) {};
                int _sockfd;
                time_point<steady_clock> _received;
                Messenger* _messengerParent;
            friend class Messenger;
        };

        /* a received response and the peer address it answers for */
        struct Response {
            std::string peerAddr;
            std::string message;
        };

        bool sendRequest(const std::string &peerAddr, const std::string &message);
        std::optional<Request> getNextRequest(int timeoutMs = -1);
        std::optional<Response> getNextResponse(int timeoutMs = -1);

    private:
        /* per-connection state, shared by the connection's two workers */
        struct Connection {
            /* frames waiting for the sender */
            BlockingQueue<std::string> outbox;

            /* inbound connections: when it was accepted. A Request older
               than its fd's current connection must not be answered on it */
            time_point<steady_clock> opened;

            /* outbound connections: the peer, to clean up '_peerConnections' */
            std::string peerAddr;

            /* set by the first worker to exit */
            bool halfClosed = false;

            /* set when the destructor closed the fd */
            bool closedByOwner = false;
        };

        void acceptLoop();
        void spawnWorkers(int sockfd, bool inbound);
        void receiverTask(int sockfd, bool inbound);
        void senderTask(int sockfd);
        void workerExiting(int sockfd, const char *worker);

        /* live connections by fd */
        unordered_map<int, std::unique_ptr<Connection>> _connections;

        /* outbound connection fd by peer address */
        unordered_map<std::string, int> _peerConnections;

        /* guards '_connections' and '_peerConnections' */
        std::mutex _m;

        BlockingQueue<Request> _requestQueue;
        BlockingQueue<Response> _responseQueue;

        /* node instances only */
        std::optional<int> _listenSock;


  public:
    // thrown when the listening socket cannot be set up
    class Exception : public std::exception {
        private:
            std::string _msg;
        public:
            Exception(const std::string& msg) : _msg(msg){}

            virtual const char* what() const noexcept override
            {
                return _msg.c_str();
            }
    };
};

#endif /* !MESSENGER_H */
