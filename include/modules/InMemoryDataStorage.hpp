#ifndef IN_MEMORY_DATA_STORAGE_HPP
#define IN_MEMORY_DATA_STORAGE_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/Capabilities.hpp"

namespace Adaptive::Modules {

class InMemoryDataStorage : public Core::DataStorage {
private:
    mutable std::mutex storeMutex;
    bool initialized = false;

    std::map<std::string, Core::ContainerState> states;
    std::map<std::string, std::vector<Core::InteractionEvent>> interactions;

    std::atomic<uint64_t> initializeCalls{0};
    std::atomic<uint64_t> releaseCalls{0};
    Core::LogLevel currentLogLevel;

    void requireInitialized(const char* operation) const;

public:
    explicit InMemoryDataStorage(Core::LogLevel level = Core::LogLevel::LIFECYCLE_ONLY);
    ~InMemoryDataStorage() override = default;

    void initialize() override;
    void saveState(const std::string& userId, const Core::ContainerState& state) override;
    std::optional<Core::ContainerState> loadState(const std::string& userId) override;
    void saveInteraction(const Core::InteractionEvent& event) override;
    std::vector<Core::InteractionEvent> loadRecent(const std::string& userId,
                                                   std::size_t limit,
                                                   const std::optional<std::string>& type = std::nullopt) override;
    void deleteUserData(const std::string& userId) override;
    void release() override;

    // --- Inspection ---
    std::size_t interactionCount(const std::string& userId) const;
    bool hasState(const std::string& userId) const;
    uint64_t initializeCount() const { return initializeCalls.load(); }
    uint64_t releaseCount() const { return releaseCalls.load(); }
};

}

#endif
