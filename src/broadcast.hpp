#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <memory>
#include <mutex>
#include <ostream>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace trelay {

class Logger;

struct BroadcastOptions {
    // Skip clients that are backed up instead of disconnecting them.
    bool drop_if_slow = false;
};

// Fan-out sink for named events.
class Broadcaster {
public:
    virtual ~Broadcaster() = default;
    virtual void broadcast(const std::string& event,
                           const nlohmann::json& payload,
                           const BroadcastOptions& options) = 0;
};

// One connected consumer.
class BroadcastClient {
public:
    virtual ~BroadcastClient() = default;
    virtual void send(const std::string& frame) = 0;
    // Bytes queued but not yet written to the consumer.
    virtual size_t buffered_bytes() const = 0;
    virtual void close(int code, const std::string& reason) = 0;
};

constexpr size_t kDefaultMaxBufferedBytes = 1024 * 1024;
constexpr int kSlowConsumerCloseCode = 1008;

// Sends every broadcast to all clients as a sequenced event frame:
//   {"type":"event","event":<name>,"payload":<json>,"seq":<n>}
// seq starts at 1 and increases once per broadcast call, whether or not a
// given client received that frame.
//
// A client with more than max_buffered_bytes pending is slow. Slow clients
// skip drop_if_slow frames; any other frame closes them with 1008
// "slow consumer". A client that throws a std::exception from any of its
// calls is removed. broadcast() itself never throws.
class BroadcastHub : public Broadcaster {
public:
    explicit BroadcastHub(size_t max_buffered_bytes = kDefaultMaxBufferedBytes,
                          Logger* log = nullptr);

    uint64_t add_client(std::shared_ptr<BroadcastClient> client);
    bool remove_client(uint64_t id);
    size_t client_count() const;

    void broadcast(const std::string& event,
                   const nlohmann::json& payload,
                   const BroadcastOptions& options) override;

    uint64_t last_seq() const;

private:
    size_t max_buffered_bytes_;
    Logger* log_;
    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<BroadcastClient>> clients_;
    uint64_t next_client_id_ = 1;
    uint64_t seq_ = 0;
};

// Writes each frame as one line to an ostream. Never slow.
class StreamClient : public BroadcastClient {
public:
    explicit StreamClient(std::ostream& out);

    void send(const std::string& frame) override;
    size_t buffered_bytes() const override { return 0; }
    void close(int code, const std::string& reason) override;

    bool closed() const;

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    bool closed_ = false;
};

} // namespace trelay
