#include "modules/InMemoryDataStorage.hpp"
#include "core/ContainerErrors.hpp"
#include <algorithm>
#include <iostream>

namespace Adaptive::Modules {

InMemoryDataStorage::InMemoryDataStorage(Core::LogLevel level) : currentLogLevel(level) {}

void InMemoryDataStorage::requireInitialized(const char* operation) const {
    if (!initialized) {
        throw Core::StorageError(std::string("InMemoryDataStorage::") + operation + " called on a storage that is not initialized");
    }
}

void InMemoryDataStorage::initialize() {
    std::lock_guard<std::mutex> lock(storeMutex);
    initialized = true;
    initializeCalls++;
    if (currentLogLevel == Core::LogLevel::DEBUG) {
        std::cout << "[MemoryStorage] Initialized." << std::endl;
    }
}

void InMemoryDataStorage::saveState(const std::string& userId, const Core::ContainerState& state) {
    std::lock_guard<std::mutex> lock(storeMutex);
    requireInitialized("saveState");
    states[userId] = state;
}

std::optional<Core::ContainerState> InMemoryDataStorage::loadState(const std::string& userId) {
    std::lock_guard<std::mutex> lock(storeMutex);
    requireInitialized("loadState");
    auto it = states.find(userId);
    if (it == states.end()) return std::nullopt;
    return it->second;
}

void InMemoryDataStorage::saveInteraction(const Core::InteractionEvent& event) {
    std::lock_guard<std::mutex> lock(storeMutex);
    requireInitialized("saveInteraction");
    interactions[event.userId].push_back(event);
}

std::vector<Core::InteractionEvent> InMemoryDataStorage::loadRecent(const std::string& userId,
                                                                    std::size_t limit,
                                                                    const std::optional<std::string>& type) {
    std::lock_guard<std::mutex> lock(storeMutex);
    requireInitialized("loadRecent");

    std::vector<Core::InteractionEvent> result;
    auto it = interactions.find(userId);
    if (it == interactions.end() || limit == 0) return result;

    // Beszúrási sorrend visszafelé, majd timestamp szerint csökkenő (azonos időnél a később mentett elöl)
    for (auto rit = it->second.rbegin(); rit != it->second.rend(); ++rit) {
        if (type && rit->type != *type) continue;
        result.push_back(*rit);
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const Core::InteractionEvent& a, const Core::InteractionEvent& b) {
                         return a.timestamp > b.timestamp;
                     });

    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

void InMemoryDataStorage::deleteUserData(const std::string& userId) {
    std::lock_guard<std::mutex> lock(storeMutex);
    requireInitialized("deleteUserData");
    states.erase(userId);
    interactions.erase(userId);
    if (currentLogLevel != Core::LogLevel::SILENT) {
        std::cout << "[MemoryStorage] Deleted all data of user " << userId << "." << std::endl;
    }
}

void InMemoryDataStorage::release() {
    std::lock_guard<std::mutex> lock(storeMutex);
    initialized = false;
    releaseCalls++;
}

std::size_t InMemoryDataStorage::interactionCount(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(storeMutex);
    auto it = interactions.find(userId);
    return it == interactions.end() ? 0 : it->second.size();
}

bool InMemoryDataStorage::hasState(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(storeMutex);
    return states.count(userId) > 0;
}

}
