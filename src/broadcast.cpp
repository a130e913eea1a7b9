#include "broadcast.hpp"
#include "log.hpp"

namespace trelay {

BroadcastHub::BroadcastHub(size_t max_buffered_bytes, Logger* log)
    : max_buffered_bytes_(max_buffered_bytes), log_(log)
{}

uint64_t BroadcastHub::add_client(std::shared_ptr<BroadcastClient> client) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_client_id_++;
    clients_.emplace(id, std::move(client));
    return id;
}

bool BroadcastHub::remove_client(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.erase(id) > 0;
}

size_t BroadcastHub::client_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

uint64_t BroadcastHub::last_seq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seq_;
}

void BroadcastHub::broadcast(const std::string& event,
                             const nlohmann::json& payload,
                             const BroadcastOptions& options) {
    // Stamp the frame and snapshot clients under lock; send without it.
    std::string frame;
    std::vector<std::pair<uint64_t, std::shared_ptr<BroadcastClient>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t seq = ++seq_;
        frame = nlohmann::json{
            {"type", "event"},
            {"event", event},
            {"payload", payload},
            {"seq", seq}
        }.dump();
        targets.assign(clients_.begin(), clients_.end());
    }

    std::vector<uint64_t> dead;
    for (auto& [id, client] : targets) {
        try {
            bool slow = client->buffered_bytes() > max_buffered_bytes_;
            if (slow && options.drop_if_slow) continue;
            if (slow) {
                dead.push_back(id);
                client->close(kSlowConsumerCloseCode, "slow consumer");
                continue;
            }
            client->send(frame);
        } catch (const std::exception& e) {
            if (log_) log_->warn("dropping client " + std::to_string(id) + ": " + e.what());
            if (dead.empty() || dead.back() != id) dead.push_back(id);
        }
    }

    if (!dead.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (uint64_t id : dead) clients_.erase(id);
    }
}

StreamClient::StreamClient(std::ostream& out)
    : out_(out)
{}

void StreamClient::send(const std::string& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    out_ << frame << "\n";
    out_.flush();
}

void StreamClient::close(int /*code*/, const std::string& /*reason*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool StreamClient::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace trelay
