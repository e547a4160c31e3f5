/**
 * @file Participant.hpp
 * @brief Person taking part in a review.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/review/value_objects/Role.hpp"

namespace safetyreview::domain::review {

struct Participant {
    std::string name;
    std::string email;
    Role role = Role::Reviewer;

    Participant() = default;
    Participant(std::string n, std::string e, Role r)
        : name(std::move(n)), email(std::move(e)), role(r) {}

    bool operator==(const Participant& other) const {
        return name == other.name && email == other.email && role == other.role;
    }
};

inline size_t CountRole(const std::vector<Participant>& participants, Role role) {
    size_t n = 0;
    for (const auto& p : participants) {
        if (p.role == role) ++n;
    }
    return n;
}

} // namespace safetyreview::domain::review
