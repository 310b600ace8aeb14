#pragma once
#include <string>
#include <map>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <cstdint>
#include <iostream>

namespace toolchat {

// Blocks a sensitive action until someone approves or denies it.
// Unanswered requests are denied after the timeout.
class ConfirmationGate {
public:
    // Called with the request id and a description; must eventually call resolve().
    using PromptHandler = std::function<void(uint64_t id, const std::string& description)>;

    explicit ConfirmationGate(int timeout_ms = 30000) : timeout_ms_(timeout_ms) {}

    void set_prompt_handler(PromptHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        prompt_ = std::move(handler);
    }

    bool request(const std::string& description) {
        PromptHandler prompt;
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!prompt_) {
                std::cerr << "[warn] No one to confirm '" << description << "', denying\n";
                return false;
            }
            prompt = prompt_;
            id = next_id_++;
            pending_[id] = Decision{};
        }

        prompt(id, description);

        std::unique_lock<std::mutex> lock(mutex_);
        bool answered = cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms_), [&] {
            return pending_[id].answered;
        });
        bool approved = answered && pending_[id].approved;
        pending_.erase(id);
        if (!answered) {
            std::cerr << "[warn] Confirmation for '" << description << "' timed out, denying\n";
        }
        return approved;
    }

    // Returns false when the request is unknown or already timed out.
    bool resolve(uint64_t id, bool approved) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it == pending_.end() || it->second.answered) return false;
            it->second.answered = true;
            it->second.approved = approved;
        }
        cv_.notify_all();
        return true;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    int timeout_ms() const { return timeout_ms_; }

private:
    struct Decision {
        bool answered = false;
        bool approved = false;
    };

    int timeout_ms_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<uint64_t, Decision> pending_;
    uint64_t next_id_ = 1;
    PromptHandler prompt_;
};

} // namespace toolchat
