#ifndef LOBBYCHAT_TESTS_FAKE_PARTICIPANT_HPP
#define LOBBYCHAT_TESTS_FAKE_PARTICIPANT_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "participant.hpp"

// Records every packet it is handed. With accepting(false) it refuses them,
// like a session whose queue is closed.
class FakeParticipant : public Participant {
public:
    FakeParticipant(SessionId id, std::string name, Privileges privileges = Privileges::Normal)
        : id_(id), name_(std::move(name)), privileges_(privileges) {}

    static std::shared_ptr<FakeParticipant> make(SessionId id, std::string name,
                                                 Privileges privileges = Privileges::Normal) {
        return std::make_shared<FakeParticipant>(id, std::move(name), privileges);
    }

    SessionId id() const override { return id_; }
    const std::string &name() const override { return name_; }
    Privileges privileges() const override { return privileges_; }

    bool enqueue(PacketPtr packet) override {
        if (!accepting_) {
            return false;
        }
        std::lock_guard lock(mu);
        received_.push_back(std::move(packet));
        return true;
    }

    void accepting(bool value) { accepting_ = value; }

    std::vector<PacketPtr> received() const {
        std::lock_guard lock(mu);
        return received_;
    }

    std::size_t receivedCount() const {
        std::lock_guard lock(mu);
        return received_.size();
    }

private:
    const SessionId id_;
    const std::string name_;
    const Privileges privileges_;
    std::atomic<bool> accepting_{true};
    mutable std::mutex mu;
    std::vector<PacketPtr> received_;
};

#endif // LOBBYCHAT_TESTS_FAKE_PARTICIPANT_HPP
