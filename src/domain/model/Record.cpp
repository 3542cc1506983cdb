/**
 * @file Record.cpp
 * @brief Contact Record aggregate implementation
 */

#include "contactbook/domain/model/Record.hpp"
#include "contactbook/shared/exception/DomainException.hpp"

#include <algorithm>

namespace contactbook::domain::model {

std::vector<Phone>::iterator Record::locate(const std::string& raw) {
    return std::find_if(phones_.begin(), phones_.end(),
        [&raw](const Phone& phone) { return phone.getValue() == raw; });
}

std::vector<Phone>::const_iterator Record::locate(const std::string& raw) const {
    return std::find_if(phones_.begin(), phones_.end(),
        [&raw](const Phone& phone) { return phone.getValue() == raw; });
}

void Record::addPhone(const std::string& raw) {
    auto phone = Phone::of(raw);
    if (locate(raw) != phones_.end()) {
        throw shared::exception::DuplicatePhoneException();
    }
    phones_.push_back(std::move(phone));
}

std::optional<Phone> Record::findPhone(const std::string& raw) const {
    auto it = locate(raw);
    if (it == phones_.end()) {
        return std::nullopt;
    }
    return *it;
}

bool Record::removePhone(const std::string& raw) {
    auto it = locate(raw);
    if (it == phones_.end()) {
        return false;
    }
    phones_.erase(it);
    return true;
}

bool Record::editPhone(const std::string& oldPhone, const std::string& newPhone) {
    auto it = locate(oldPhone);
    if (it == phones_.end()) {
        return false;
    }

    auto replacement = Phone::of(newPhone);
    auto existing = locate(newPhone);
    if (existing != phones_.end() && existing != it) {
        throw shared::exception::DuplicatePhoneException();
    }

    *it = std::move(replacement);
    return true;
}

void Record::addBirthday(const std::string& raw) {
    birthday_ = Birthday::of(raw);
}

std::string Record::describe() const {
    std::string phones;
    for (size_t i = 0; i < phones_.size(); i++) {
        if (i > 0) phones += "; ";
        phones += phones_[i].getValue();
    }

    std::string birthday = birthday_ ? birthday_->format() : NO_BIRTHDAY;
    return id_.getValue() + ": phones=[" + phones + "], birthday=" + birthday;
}

std::optional<CalendarDate> Record::congratulationDate(
    const CalendarDate& today, int windowDays) const {
    if (!birthday_) {
        return std::nullopt;
    }

    CalendarDate next = birthday_->getDate().withYear(today.getYear());
    if (next < today) {
        next = birthday_->getDate().withYear(today.getYear() + 1);
    }

    long delta = today.daysUntil(next);
    if (delta < 0 || delta > windowDays) {
        return std::nullopt;
    }

    int weekday = next.weekday();
    if (weekday >= CalendarDate::SATURDAY) {
        next = next.plusDays(CalendarDate::DAYS_IN_WEEK - weekday);
    }
    return next;
}

} // namespace contactbook::domain::model
