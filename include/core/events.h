#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace zackathon {
namespace core {

enum class ContractEventType : uint8_t {
    HackathonCreated = 0,
    ParticipantRegistered = 1,
    ProjectSubmitted = 2,
    JudgeAccessGranted = 3,
    ScoreSubmitted = 4,
    WinnersCalculated = 5,
    ScoreDecrypted = 6,
    WinnersAnnounced = 7
};

const char* eventTypeToString(ContractEventType type);

struct ContractEvent {
    uint64_t sequence = 0;
    ContractEventType type = ContractEventType::HackathonCreated;
    uint64_t hackathonId = 0;
    uint64_t timestamp = 0;
    std::map<std::string, std::string> fields;

    std::string field(const std::string& name) const;
    std::vector<uint8_t> serialize() const;
    static ContractEvent deserialize(const std::vector<uint8_t>& data);
};

using ContractEventHandler = std::function<void(const ContractEvent&)>;

// Synchronous fan-out to subscribers. Handlers run on the publishing thread.
class EventBus {
public:
    EventBus();
    ~EventBus();

    std::string subscribe(ContractEventType type, ContractEventHandler handler);
    std::string subscribeAll(ContractEventHandler handler);
    void unsubscribe(const std::string& id);

    void publish(const ContractEvent& event);

    uint64_t getPublishedCount() const;
    size_t getSubscriptionCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
