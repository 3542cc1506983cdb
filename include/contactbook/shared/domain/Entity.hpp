/**
 * @file Entity.hpp
 * @brief Base class for identity-bearing domain objects
 */

#pragma once

#include <utility>

namespace contactbook::shared::domain {

/**
 * @brief Holder of an aggregate's identity
 *
 * The identity is fixed at construction; derived classes expose it under
 * their own accessor name. An entity is owned by exactly one container, so
 * it moves but never copies.
 *
 * @tparam IdType Identity value type
 */
template<typename IdType>
class Entity {
protected:
    IdType id_;

    explicit Entity(IdType id) : id_(std::move(id)) {}

public:
    virtual ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;
    Entity(Entity&&) noexcept = default;
    Entity& operator=(Entity&&) noexcept = default;
};

} // namespace contactbook::shared::domain
