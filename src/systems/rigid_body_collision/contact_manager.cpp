/**
 * @file contact_manager.cpp
 * @brief Implementation of contact persistence and warm-starting
 */

#include "collide2d/systems/rigid_body_collision/contact_manager.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_map>
#include <utility>

#define ENABLE_CONTACT_MANAGER_DEBUG 0
#define DEBUG(x) do { if (ENABLE_CONTACT_MANAGER_DEBUG) { std::cout << x; } } while(0)

namespace RigidBodyCollision {

/**
 * @brief Private storage for contact manager
 */
class ContactManager::ContactData
{
public:
    std::vector<ContactConstraint> pending;   ///< found this step, not yet matched
    std::vector<ContactConstraint> current;   ///< matched and being solved; next step's cache
};

namespace {

ContactPoint makePoint(const ContactConstraint& cc, const Contact& c) {
    ContactPoint p;
    p.id = ContactPointId{cc.getId(), c.id};
    p.fixture1 = cc.fixture1;
    p.fixture2 = cc.fixture2;
    p.point = c.p;
    p.normal = cc.normal;
    p.depth = c.depth;
    p.sensor = cc.sensor;
    return p;
}

bool sameContact(const Contact& newContact, const Contact& oldContact, double warmStartDistanceSquared) {
    if (isDistanceId(newContact.id)) {
        return isDistanceId(oldContact.id) &&
               newContact.p.distanceSquared(oldContact.p) <= warmStartDistanceSquared;
    }
    return newContact.id == oldContact.id;
}

} // namespace

//------------------------------------------------------------------------------
// ContactManager Implementation
//------------------------------------------------------------------------------

ContactManager::ContactManager()
    : m_data(std::make_unique<ContactData>())
{
}

ContactManager::~ContactManager() = default;

void ContactManager::add(ContactConstraint constraint)
{
    m_data->pending.push_back(std::move(constraint));
}

void ContactManager::updateContacts(const Settings& settings)
{
    auto& pending = m_data->pending;
    auto& previous = m_data->current;
    double const warmStartDistanceSquared = settings.getWarmStartDistanceSquared();

    // index last step's solvable constraints
    std::unordered_map<ContactConstraintId, std::size_t, ContactConstraintIdHash> cache;
    cache.reserve(previous.size());
    for (std::size_t i = 0; i < previous.size(); ++i) {
        if (!previous[i].sensor) {
            cache.emplace(previous[i].getId(), i);
        }
    }
    std::vector<bool> previousMatched(previous.size(), false);

    for (auto& cc : pending) {
        if (cc.sensor) {
            for (const auto& c : cc.contacts) {
                ContactPoint const p = makePoint(cc, c);
                for (auto& l : m_listeners) {
                    l->sensed(p);
                }
            }
            continue;
        }

        auto it = cache.find(cc.getId());
        if (it == cache.end()) {
            for (auto& c : cc.contacts) {
                ContactPoint const p = makePoint(cc, c);
                bool allow = true;
                for (auto& l : m_listeners) {
                    allow = l->begin(p) && allow;
                }
                c.enabled = allow;
            }
            continue;
        }

        previousMatched[it->second] = true;
        const ContactConstraint& old = previous[it->second];
        std::vector<bool> oldUsed(old.contacts.size(), false);

        for (auto& c : cc.contacts) {
            bool found = false;
            for (std::size_t j = 0; j < old.contacts.size(); ++j) {
                if (oldUsed[j] || !sameContact(c, old.contacts[j], warmStartDistanceSquared)) {
                    continue;
                }
                const Contact& oc = old.contacts[j];
                oldUsed[j] = true;
                found = true;

                if (settings.WarmStartingEnabled) {
                    c.jn = oc.jn;
                    c.jt = oc.jt;
                }

                PersistedContactPoint pp;
                static_cast<ContactPoint&>(pp) = makePoint(cc, c);
                pp.oldPoint = oc.p;
                pp.oldNormal = old.normal;
                pp.oldDepth = oc.depth;

                bool allow = true;
                for (auto& l : m_listeners) {
                    allow = l->persist(pp) && allow;
                }
                c.enabled = allow;
                break;
            }

            if (!found) {
                ContactPoint const p = makePoint(cc, c);
                bool allow = true;
                for (auto& l : m_listeners) {
                    allow = l->begin(p) && allow;
                }
                c.enabled = allow;
            }
        }

        // old points with no successor
        for (std::size_t j = 0; j < old.contacts.size(); ++j) {
            if (!oldUsed[j]) {
                ContactPoint const p = makePoint(old, old.contacts[j]);
                for (auto& l : m_listeners) {
                    l->end(p);
                }
            }
        }
    }

    // pairs that stopped touching
    for (std::size_t i = 0; i < previous.size(); ++i) {
        if (previousMatched[i] || previous[i].sensor) {
            continue;
        }
        for (const auto& c : previous[i].contacts) {
            ContactPoint const p = makePoint(previous[i], c);
            for (auto& l : m_listeners) {
                l->end(p);
            }
        }
    }

    DEBUG("[ContactManager] " << pending.size() << " constraints, "
          << previous.size() << " cached\n");

    previous = std::move(pending);
    pending.clear();
}

void ContactManager::preSolveNotify()
{
    if (m_listeners.empty()) {
        return;
    }
    for (auto& cc : m_data->current) {
        if (cc.sensor) {
            continue;
        }
        for (auto& c : cc.contacts) {
            if (!c.enabled) {
                continue;
            }
            ContactPoint const p = makePoint(cc, c);
            bool allow = true;
            for (auto& l : m_listeners) {
                allow = l->preSolve(p) && allow;
            }
            c.enabled = allow;
        }
    }
}

void ContactManager::postSolveNotify()
{
    if (m_listeners.empty()) {
        return;
    }
    for (const auto& cc : m_data->current) {
        if (cc.sensor) {
            continue;
        }
        for (const auto& c : cc.contacts) {
            if (!c.enabled) {
                continue;
            }
            SolvedContactPoint sp;
            static_cast<ContactPoint&>(sp) = makePoint(cc, c);
            sp.normalImpulse = c.jn;
            sp.tangentImpulse = c.jt;
            for (auto& l : m_listeners) {
                l->postSolve(sp);
            }
        }
    }
}

void ContactManager::addListener(std::shared_ptr<ContactListener> listener)
{
    if (listener) {
        m_listeners.push_back(std::move(listener));
    }
}

bool ContactManager::removeListener(const std::shared_ptr<ContactListener>& listener)
{
    auto it = std::find(m_listeners.begin(), m_listeners.end(), listener);
    if (it == m_listeners.end()) {
        return false;
    }
    m_listeners.erase(it);
    return true;
}

std::vector<ContactConstraint>& ContactManager::getConstraints()
{
    return m_data->current;
}

const std::vector<ContactConstraint>& ContactManager::getConstraints() const
{
    return m_data->current;
}

void ContactManager::clear()
{
    m_data->pending.clear();
}

void ContactManager::reset()
{
    m_data->pending.clear();
    m_data->current.clear();
}

bool ContactManager::isListEmpty() const
{
    return m_data->pending.empty();
}

bool ContactManager::isCacheEmpty() const
{
    return m_data->current.empty();
}

} // namespace RigidBodyCollision
