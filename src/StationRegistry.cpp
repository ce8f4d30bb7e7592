#include "StationRegistry.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include "StreamReader.hpp"

StationRegistry::StationRegistry(std::string const& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
        throw std::runtime_error("Could not open station registry " + filepath);

    std::string line;
    std::getline(file, line);

    while (std::getline(file, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty()) continue;

        std::vector<std::string> cells = StreamReader::splitLine(line);
        cells.resize(std::max<std::size_t>(cells.size(), 3));
        std::string const& station_id  = cells[0];
        std::string const& name        = cells[1];
        std::string const& capacityStr = cells[2];

        if (station_id.empty()) continue;

        int capacity = DEFAULT_CAPACITY;
        if (!capacityStr.empty())
        {
            try
            {
                capacity = std::stoi(capacityStr);
            }
            catch (std::exception const&)
            {
                std::cerr << "[Stations] Ignoring capacity '" << capacityStr
                          << "' of " << station_id << "\n";
            }
        }

        add(station_id, name.empty() ? station_id : name, capacity);
    }

    std::cout << "[Stations] Loaded " << stationNames.size() << " charging stations\n";
}

void StationRegistry::add(std::string const& stationId, std::string const& name, int capacity)
{
    stationNames[stationId] = name;
    capacities[stationId]   = std::max(1, capacity);
}

bool StationRegistry::exists(std::string const& stationId) const
{
    return stationNames.count(stationId) > 0;
}

std::string StationRegistry::getName(std::string const& stationId) const
{
    auto it = stationNames.find(stationId);
    if (it != stationNames.end())
        return it->second;

    return stationId;
}

int StationRegistry::getCapacity(std::string const& stationId) const
{
    auto it = capacities.find(stationId);
    if (it != capacities.end())
        return it->second;

    return DEFAULT_CAPACITY;
}

std::vector<std::string> StationRegistry::stationIds() const
{
    std::vector<std::string> ids;
    ids.reserve(stationNames.size());
    for (const auto& kv : stationNames)
        ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}
