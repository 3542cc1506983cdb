/**
 * @file Directory.hpp
 * @brief Keyed collection of contact Records
 */

#pragma once

#include "Record.hpp"
#include "CalendarDate.hpp"
#include <iterator>
#include <list>
#include <string>
#include <unordered_map>
#include <vector>

namespace contactbook::domain::model {

/**
 * @brief One entry of the upcoming-birthdays report
 */
struct UpcomingBirthday {
    std::string name;
    std::string congratulationDate;     ///< DD.MM.YYYY, weekend-adjusted

    bool operator==(const UpcomingBirthday& other) const {
        return name == other.name && congratulationDate == other.congratulationDate;
    }
};

/**
 * @brief The contact directory (address book)
 *
 * Owns every Record, keyed by exact contact name. Iteration follows
 * insertion order; a replaced record takes over the slot of the one it
 * replaced. Pointers returned by find() stay valid until that entry is
 * deleted or replaced.
 */
class Directory {
public:
    static constexpr int DEFAULT_WINDOW_DAYS = 7;

    Directory() = default;
    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;
    Directory(Directory&&) = default;
    Directory& operator=(Directory&&) = default;

    /**
     * @brief Insert, or replace the whole record stored under the same name
     */
    void addRecord(Record record);

    /**
     * @brief Exact-name lookup
     * @return Non-owning pointer to the stored record, or nullptr
     */
    [[nodiscard]] Record* find(const std::string& name);
    [[nodiscard]] const Record* find(const std::string& name) const;

    /**
     * @brief Remove a record
     * @return true if the name existed
     */
    bool remove(const std::string& name);

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

    /**
     * @brief All records in insertion order
     */
    [[nodiscard]] const std::list<Record>& records() const noexcept { return records_; }

    /**
     * @brief Contacts to congratulate within windowDays of today
     *
     * Records without a birthday are skipped. Output follows directory
     * order, not date order.
     */
    [[nodiscard]] std::vector<UpcomingBirthday> upcomingBirthdays(
        const CalendarDate& today,
        int windowDays = DEFAULT_WINDOW_DAYS) const;

private:
    std::list<Record> records_;
    std::unordered_map<std::string, std::list<Record>::iterator> index_;
};

} // namespace contactbook::domain::model
