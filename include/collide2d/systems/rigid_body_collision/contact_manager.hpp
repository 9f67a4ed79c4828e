/**
 * @file contact_manager.hpp
 * @brief Contact persistence and warm-starting for rigid body collision
 *
 * Each step the narrowphase hands in fresh constraints. The manager matches
 * them against last step's constraints, carries accumulated impulses across
 * for warm starting, and raises begin/persist/end/sensed notifications on the
 * registered listeners.
 */

#ifndef COLLIDE2D_CONTACT_MANAGER_HPP
#define COLLIDE2D_CONTACT_MANAGER_HPP

#include <memory>
#include <vector>

#include "collide2d/core/settings.hpp"
#include "collide2d/systems/rigid_body_collision/contact_constraint.hpp"
#include "collide2d/systems/rigid_body_collision/contact_listener.hpp"

namespace RigidBodyCollision {

class ContactManager {
public:
    ContactManager();
    ~ContactManager();

    ContactManager(const ContactManager&) = delete;
    ContactManager& operator=(const ContactManager&) = delete;

    /** @brief Queues a constraint found this step */
    void add(ContactConstraint constraint);

    /**
     * @brief Matches queued constraints against last step's and notifies listeners
     *
     * Matched contact points copy their accumulated impulses (when warm
     * starting is enabled) and report persist; unmatched new points report
     * begin; old points with no successor report end. Sensor constraints only
     * report sensed. Afterwards the queued constraints become the current set.
     */
    void updateContacts(const Settings& settings);

    /** @brief Gives listeners a last chance to disable contacts before solving */
    void preSolveNotify();

    /** @brief Reports the solved impulses of every enabled contact */
    void postSolveNotify();

    void addListener(std::shared_ptr<ContactListener> listener);
    bool removeListener(const std::shared_ptr<ContactListener>& listener);

    /** @brief Constraints of the current step (the warm-start cache for the next one) */
    std::vector<ContactConstraint>& getConstraints();
    const std::vector<ContactConstraint>& getConstraints() const;

    /** @brief Drops queued constraints */
    void clear();

    /** @brief Drops queued and cached constraints without notifying */
    void reset();

    bool isListEmpty() const;
    bool isCacheEmpty() const;

private:
    class ContactData;  ///< PIMPL for constraint storage
    std::unique_ptr<ContactData> m_data;
    std::vector<std::shared_ptr<ContactListener>> m_listeners;
};

} // namespace RigidBodyCollision

#endif
