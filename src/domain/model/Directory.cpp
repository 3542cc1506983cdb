/**
 * @file Directory.cpp
 * @brief Contact directory implementation
 */

#include "contactbook/domain/model/Directory.hpp"

namespace contactbook::domain::model {

void Directory::addRecord(Record record) {
    const std::string key = record.getName().getValue();

    auto it = index_.find(key);
    if (it != index_.end()) {
        // Replace, never merge
        *it->second = std::move(record);
        return;
    }

    records_.push_back(std::move(record));
    index_.emplace(key, std::prev(records_.end()));
}

Record* Directory::find(const std::string& name) {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &*it->second;
}

const Record* Directory::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &*it->second;
}

bool Directory::remove(const std::string& name) {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return false;
    }
    records_.erase(it->second);
    index_.erase(it);
    return true;
}

bool Directory::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

std::vector<UpcomingBirthday> Directory::upcomingBirthdays(
    const CalendarDate& today, int windowDays) const {
    std::vector<UpcomingBirthday> result;

    for (const auto& record : records_) {
        auto date = record.congratulationDate(today, windowDays);
        if (!date) continue;
        result.push_back({record.getName().getValue(), date->format()});
    }

    return result;
}

} // namespace contactbook::domain::model
