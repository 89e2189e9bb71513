#include "core/events.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>

namespace zackathon {
namespace core {

const char* eventTypeToString(ContractEventType type) {
    switch (type) {
        case ContractEventType::HackathonCreated: return "HackathonCreated";
        case ContractEventType::ParticipantRegistered: return "ParticipantRegistered";
        case ContractEventType::ProjectSubmitted: return "ProjectSubmitted";
        case ContractEventType::JudgeAccessGranted: return "JudgeAccessGranted";
        case ContractEventType::ScoreSubmitted: return "ScoreSubmitted";
        case ContractEventType::WinnersCalculated: return "WinnersCalculated";
        case ContractEventType::ScoreDecrypted: return "ScoreDecrypted";
        case ContractEventType::WinnersAnnounced: return "WinnersAnnounced";
    }
    return "Unknown";
}

std::string ContractEvent::field(const std::string& name) const {
    auto it = fields.find(name);
    return it != fields.end() ? it->second : std::string();
}

std::vector<uint8_t> ContractEvent::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint64(sequence);
    buf.writeUint8(static_cast<uint8_t>(type));
    buf.writeUint64(hackathonId);
    buf.writeUint64(timestamp);
    buf.writeVarInt(fields.size());
    for (const auto& [k, v] : fields) {
        buf.writeString(k);
        buf.writeString(v);
    }
    return buf.data();
}

ContractEvent ContractEvent::deserialize(const std::vector<uint8_t>& data) {
    utils::ByteBuffer buf(data);
    ContractEvent e;
    e.sequence = buf.readUint64();
    uint8_t type = buf.readUint8();
    if (type > static_cast<uint8_t>(ContractEventType::WinnersAnnounced)) {
        throw std::runtime_error("Invalid event type");
    }
    e.type = static_cast<ContractEventType>(type);
    e.hackathonId = buf.readUint64();
    e.timestamp = buf.readUint64();
    uint64_t n = buf.readVarInt();
    for (uint64_t i = 0; i < n; i++) {
        std::string k = buf.readString();
        e.fields[k] = buf.readString();
    }
    return e;
}

struct EventBus::Impl {
    struct Subscription {
        std::string id;
        bool all;
        ContractEventType type;
        ContractEventHandler handler;
    };

    std::vector<Subscription> subscriptions;
    std::atomic<uint64_t> published{0};
    uint64_t nextId = 0;
    mutable std::mutex mtx;
};

EventBus::EventBus() : impl_(std::make_unique<Impl>()) {}
EventBus::~EventBus() = default;

std::string EventBus::subscribe(ContractEventType type, ContractEventHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    Impl::Subscription sub{"sub_" + std::to_string(impl_->nextId++), false, type, std::move(handler)};
    impl_->subscriptions.push_back(sub);
    return sub.id;
}

std::string EventBus::subscribeAll(ContractEventHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    Impl::Subscription sub{"sub_" + std::to_string(impl_->nextId++), true,
                           ContractEventType::HackathonCreated, std::move(handler)};
    impl_->subscriptions.push_back(sub);
    return sub.id;
}

void EventBus::unsubscribe(const std::string& id) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->subscriptions.erase(
        std::remove_if(impl_->subscriptions.begin(), impl_->subscriptions.end(),
            [&id](const Impl::Subscription& s) { return s.id == id; }),
        impl_->subscriptions.end());
}

void EventBus::publish(const ContractEvent& event) {
    std::vector<Impl::Subscription> targets;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        for (const auto& sub : impl_->subscriptions) {
            if (sub.all || sub.type == event.type) targets.push_back(sub);
        }
    }
    impl_->published++;

    for (const auto& sub : targets) {
        try {
            sub.handler(event);
        } catch (const std::exception& e) {
            utils::Logger::log(utils::LogLevel::WARN, "events",
                               std::string("Handler ") + sub.id + " failed on " +
                               eventTypeToString(event.type) + ": " + e.what());
        }
    }
}

uint64_t EventBus::getPublishedCount() const {
    return impl_->published.load();
}

size_t EventBus::getSubscriptionCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->subscriptions.size();
}

}
}
