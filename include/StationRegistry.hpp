#pragma once
#include <string>
#include <unordered_map>
#include <vector>

// Charging station metadata: display names and slot capacity.
// Stations absent from the registry are single-slot and named by their id.
class StationRegistry
{
private:
    std::unordered_map<std::string, std::string> stationNames;
    std::unordered_map<std::string, int> capacities;

public:
    StationRegistry() = default;
    explicit StationRegistry(std::string const& filepath);

    static constexpr int DEFAULT_CAPACITY = 1;

    void add(std::string const& stationId, std::string const& name, int capacity);
    bool exists(std::string const& stationId) const;
    std::string getName(std::string const& stationId) const;
    int getCapacity(std::string const& stationId) const;
    std::vector<std::string> stationIds() const;
    std::size_t size() const noexcept { return stationNames.size(); }
};
