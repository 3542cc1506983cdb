/**
 * @file CommandHandlers.cpp
 * @brief Command handler implementations
 */

#include "contactbook/application/CommandHandlers.hpp"
#include "contactbook/shared/exception/ApplicationException.hpp"
#include "contactbook/shared/exception/DomainException.hpp"
#include "contactbook/utils/string_utils.h"

#include <spdlog/spdlog.h>
#include <vector>

namespace contactbook::application {

using domain::model::CalendarDate;
using domain::model::Directory;
using domain::model::Record;
using shared::exception::ApplicationException;
using shared::exception::DomainException;

namespace {

void requireArgs(const Args& args, size_t count) {
    if (args.size() < count) {
        throw ApplicationException("MISSING_ARGUMENT", MISSING_ARGUMENT_MESSAGE);
    }
}

std::string contactNotFound(const std::string& name) {
    return "Error: Contact '" + name + "' not found.";
}

} // namespace

std::string guardHandler(const std::string& command, const std::function<std::string()>& action) {
    try {
        return action();
    } catch (const DomainException& e) {
        spdlog::debug("[{}] rejected: {} ({})", command, e.getMessage(), e.getCode());
        return e.getMessage();
    } catch (const ApplicationException& e) {
        spdlog::debug("[{}] rejected: {} ({})", command, e.getMessage(), e.getCode());
        return e.getMessage();
    }
}

std::string addContact(const Args& args, Directory& directory) {
    if (args.empty()) {
        return "Error: Please provide at least a name.";
    }

    const std::string& name = args[0];
    const bool hasPhone = args.size() > 1;

    Record* record = directory.find(name);
    if (!record) {
        // Built completely before insertion: a rejected phone leaves no contact behind
        auto created = Record::create(name);
        if (hasPhone) {
            created.addPhone(args[1]);
        }
        directory.addRecord(std::move(created));
        spdlog::debug("Contact created: {}", name);

        if (hasPhone) {
            return "Contact '" + name + "' created with phone " + args[1] + ".";
        }
        return "Contact '" + name + "' created without phone.";
    }

    if (hasPhone) {
        record->addPhone(args[1]);
        spdlog::debug("Phone added to contact: {}", name);
        return "Phone " + args[1] + " added to contact '" + name + "'.";
    }
    return "Contact '" + name + "' already exists.";
}

std::string changeContact(const Args& args, Directory& directory) {
    requireArgs(args, 3);
    const std::string& name = args[0];

    Record* record = directory.find(name);
    if (!record) {
        return contactNotFound(name);
    }

    if (record->editPhone(args[1], args[2])) {
        spdlog::debug("Phone changed for contact: {}", name);
        return "Contact updated.";
    }
    return "Error: Phone '" + args[1] + "' not found.";
}

std::string showPhone(const Args& args, const Directory& directory) {
    requireArgs(args, 1);
    const std::string& name = args[0];

    const Record* record = directory.find(name);
    if (!record) {
        return contactNotFound(name);
    }
    if (record->getPhones().empty()) {
        return "Contact '" + name + "' has no phones.";
    }

    std::vector<std::string> phones;
    for (const auto& phone : record->getPhones()) {
        phones.push_back(phone.getValue());
    }
    return "Phones of " + name + ": " + utils::join(phones, ", ");
}

std::string removePhone(const Args& args, Directory& directory) {
    requireArgs(args, 2);
    const std::string& name = args[0];

    Record* record = directory.find(name);
    if (!record) {
        return contactNotFound(name);
    }
    if (record->removePhone(args[1])) {
        return "Phone " + args[1] + " removed from contact '" + name + "'.";
    }
    return "Error: Phone '" + args[1] + "' not found.";
}

std::string deleteContact(const Args& args, Directory& directory) {
    requireArgs(args, 1);
    const std::string& name = args[0];

    if (directory.remove(name)) {
        spdlog::debug("Contact deleted: {}", name);
        return "Contact '" + name + "' deleted.";
    }
    return contactNotFound(name);
}

std::string showAll(const Directory& directory) {
    if (directory.empty()) {
        return "No contacts found.";
    }

    std::vector<std::string> lines;
    for (const auto& record : directory.records()) {
        lines.push_back(record.describe());
    }
    return utils::join(lines, "\n");
}

std::string addBirthday(const Args& args, Directory& directory) {
    requireArgs(args, 2);
    const std::string& name = args[0];
    const std::string& birthday = args[1];

    Record* record = directory.find(name);
    if (!record) {
        auto created = Record::create(name);
        created.addBirthday(birthday);
        directory.addRecord(std::move(created));
        spdlog::debug("Contact created with birthday: {}", name);
        return "Contact '" + name + "' created with birthday " + birthday + ".";
    }

    record->addBirthday(birthday);
    return "Birthday " + birthday + " added to contact '" + name + "'.";
}

std::string showBirthday(const Args& args, const Directory& directory) {
    requireArgs(args, 1);
    const std::string& name = args[0];

    const Record* record = directory.find(name);
    if (!record) {
        return contactNotFound(name);
    }
    if (!record->hasBirthday()) {
        return "Error: Contact '" + name + "' has no birthday.";
    }
    return "Birthday of " + name + " is " + record->getBirthday()->format();
}

std::string showUpcomingBirthdays(const Directory& directory, const CalendarDate& today, int windowDays) {
    auto upcoming = directory.upcomingBirthdays(today, windowDays);
    spdlog::debug("Upcoming birthdays from {} (+{} days): {}", today.format(), windowDays, upcoming.size());
    if (upcoming.empty()) {
        return "No upcoming birthdays.";
    }

    std::vector<std::string> lines{"Upcoming birthdays:"};
    for (const auto& entry : upcoming) {
        lines.push_back(entry.name + ": " + entry.congratulationDate);
    }
    return utils::join(lines, "\n");
}

} // namespace contactbook::application
