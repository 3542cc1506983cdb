/**
 * @file Record.hpp
 * @brief Aggregate Root for one contact
 */

#pragma once

#include "contactbook/shared/domain/Entity.hpp"
#include "ContactName.hpp"
#include "Phone.hpp"
#include "Birthday.hpp"
#include <string>
#include <vector>
#include <optional>

namespace contactbook::domain::model {

/**
 * @brief Contact Record Aggregate Root
 *
 * Identity is the contact name, fixed at creation. Phones keep insertion
 * order and never contain the same number twice. All field validation
 * happens in the value objects, so a failed call leaves the record untouched.
 */
class Record : public shared::domain::Entity<ContactName> {
private:
    std::vector<Phone> phones_;
    std::optional<Birthday> birthday_;

    explicit Record(ContactName name)
        : Entity<ContactName>(std::move(name)) {}

public:
    /// Placeholder rendered by describe() when no birthday is set
    static constexpr const char* NO_BIRTHDAY = "\xE2\x80\x94";

    /**
     * @brief Create a record with no phones and no birthday
     * @throws shared::exception::ValidationException if name is empty
     */
    static Record create(const std::string& name) {
        return Record(ContactName::of(name));
    }

    // Getters
    [[nodiscard]] const ContactName& getName() const noexcept { return id_; }
    [[nodiscard]] const std::vector<Phone>& getPhones() const noexcept { return phones_; }
    [[nodiscard]] const std::optional<Birthday>& getBirthday() const noexcept { return birthday_; }
    [[nodiscard]] bool hasBirthday() const noexcept { return birthday_.has_value(); }

    // Domain methods

    /**
     * @brief Append a phone
     * @throws shared::exception::ValidationException if raw is not a valid phone
     * @throws shared::exception::DuplicatePhoneException if raw is already on the record
     */
    void addPhone(const std::string& raw);

    /**
     * @brief Look up a phone by exact value
     */
    [[nodiscard]] std::optional<Phone> findPhone(const std::string& raw) const;

    /**
     * @brief Remove the phone equal to raw
     * @return true if a phone was removed
     */
    bool removePhone(const std::string& raw);

    /**
     * @brief Replace oldPhone with newPhone at the same position
     *
     * newPhone is validated only once oldPhone has been found.
     *
     * @return false if oldPhone is not on the record (nothing changes)
     * @throws shared::exception::ValidationException if newPhone is invalid
     * @throws shared::exception::DuplicatePhoneException if newPhone is another entry's value
     */
    bool editPhone(const std::string& oldPhone, const std::string& newPhone);

    /**
     * @brief Set or overwrite the birthday
     * @throws shared::exception::ValidationException if raw is not DD.MM.YYYY
     */
    void addBirthday(const std::string& raw);

    /**
     * @brief One-line summary: "name: phones=[p1; p2], birthday=DD.MM.YYYY"
     */
    [[nodiscard]] std::string describe() const;

    /**
     * @brief Date to congratulate this contact, if the birthday falls in the window
     *
     * The birthday is taken in today's year, or the next year once it has
     * passed. It qualifies when 0 <= days from today <= windowDays. A Saturday
     * or Sunday is moved forward by (7 - weekday) days, landing on Monday.
     *
     * @param today Reference date (injected, never read from the clock here)
     * @param windowDays Inclusive look-ahead in days
     * @return The congratulation date, or std::nullopt (no birthday, or outside the window)
     */
    [[nodiscard]] std::optional<CalendarDate> congratulationDate(
        const CalendarDate& today, int windowDays) const;

private:
    std::vector<Phone>::iterator locate(const std::string& raw);
    std::vector<Phone>::const_iterator locate(const std::string& raw) const;
};

} // namespace contactbook::domain::model
