/**
 * libcurl transport tests against a loopback listener that never answers.
 * Asserts:
 * - A token deadline surfaces as Timeout, not as a network error.
 * - Cancelling the token aborts an in-flight transfer as Cancelled.
 * - A dead port is a NetworkError; transports can be created concurrently.
 *
 * Run from build dir: ./test_http_transport
 */

#include "http_client.h"
#include "memory_client.h"
#include "plugins/memory_plugin.h"
#include "logger.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace vortex_l0;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

/// Socket bound to 127.0.0.1 on an ephemeral port. With listen() the kernel
/// completes the handshake but nothing ever reads or replies.
class LoopbackSocket {
public:
    explicit LoopbackSocket(bool listening) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) return;
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) return;
        if (listening && listen(fd_, 8) != 0) return;
        socklen_t len = sizeof(addr);
        if (getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return;
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackSocket() { close(); }

    LoopbackSocket(const LoopbackSocket&) = delete;
    LoopbackSocket& operator=(const LoopbackSocket&) = delete;

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool ok() const { return port_ != 0; }
    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    int fd_ = -1;
    int port_ = 0;
};

HttpRequest post_to(const std::string& url) {
    HttpRequest request;
    request.method = "POST";
    request.url = url + "/api/v1/memory";
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = R"({"title": "t", "content": "c"})";
    return request;
}

long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

} // namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    LoopbackSocket stalled(true);
    ASSERT(stalled.ok());

    // --- deadline on a stalled server ---
    {
        CurlHttpTransport transport;
        auto start = std::chrono::steady_clock::now();
        auto result = transport.send(post_to(stalled.url()), CancellationToken::with_timeout(300));
        long took = elapsed_ms(start);

        ASSERT(result.is_error());
        ASSERT(result.error().type == ErrorType::Timeout);
        ASSERT(result.error().message == "Request timed out");
        ASSERT(took >= 250);
        ASSERT(took < 4000);
    }

    // --- cancellation while the transfer is waiting ---
    {
        CurlHttpTransport transport;
        CancellationToken token;
        std::thread canceller([token]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            token.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        auto result = transport.send(post_to(stalled.url()), token);
        long took = elapsed_ms(start);
        canceller.join();

        ASSERT(result.is_error());
        ASSERT(result.error().type == ErrorType::Cancelled);
        ASSERT(result.error().message == "Request cancelled");
        ASSERT(took < 4000);
    }

    // --- token already stopped: no transfer is attempted ---
    {
        CurlHttpTransport transport;
        CancellationToken cancelled;
        cancelled.cancel();
        auto result = transport.send(post_to(stalled.url()), cancelled);
        ASSERT(result.is_error() && result.error().type == ErrorType::Cancelled);

        CancellationToken expired = CancellationToken::with_timeout(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        auto late = transport.send(post_to(stalled.url()), expired);
        ASSERT(late.is_error() && late.error().type == ErrorType::Timeout);
    }

    // --- nothing listening is a network error ---
    {
        LoopbackSocket closed_port(false);
        ASSERT(closed_port.ok());
        const std::string url = closed_port.url();
        closed_port.close();

        CurlHttpTransport transport;
        auto result = transport.send(post_to(url), CancellationToken::with_timeout(3000));
        ASSERT(result.is_error());
        ASSERT(result.error().type == ErrorType::NetworkError);
    }

    // --- memory plugin over the real transport reports the timeout ---
    {
        MemoryServiceConfig cfg;
        cfg.api_url = stalled.url();
        cfg.user_id = "user-42";
        cfg.timeout_ms = 300;
        auto client = std::make_shared<MemoryClient>(cfg, std::make_shared<CurlHttpTransport>());
        Plugin plugin = make_memory_plugin(client);

        PluginContext ctx;
        ctx.query = "remember that the deploy key rotates monthly";
        Response r = plugin.handler(ctx);
        ASSERT(r.type == ResponseType::Memory);
        ASSERT(r.message == "Could not save: Request timed out");
    }

    // --- transports created and destroyed from several threads ---
    {
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([] {
                CurlHttpTransport transport(1000);
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        // Global curl state survives the destruction of earlier transports
        std::unique_ptr<CurlHttpTransport> first(new CurlHttpTransport());
        first.reset();
        CurlHttpTransport second;
        auto result = second.send(post_to(stalled.url()), CancellationToken::with_timeout(200));
        ASSERT(result.is_error());
        ASSERT(result.error().type == ErrorType::Timeout);
    }

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All http transport tests passed.\n";
    return 0;
}
