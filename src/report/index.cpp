// ==============================================================================
// index.cpp - Группировка записей
// ==============================================================================

#include "domaindump/index.hpp"

#include <limits>
#include <optional>

namespace domaindump::index {

void GroupedEntities::add(const std::string& key, std::size_t member) {
    auto it = positions_.find(key);
    if (it == positions_.end()) {
        positions_.emplace(key, groups_.size());
        groups_.push_back(Group{key, {member}});
        return;
    }
    groups_[it->second].members.push_back(member);
}

const Group* GroupedEntities::find(const std::string& key) const {
    auto it = positions_.find(key);
    if (it == positions_.end()) {
        return nullptr;
    }
    return &groups_[it->second];
}

std::size_t GroupedEntities::total_members() const {
    std::size_t total = 0;
    for (const auto& g : groups_) {
        total += g.members.size();
    }
    return total;
}

GroupedEntities group_by_os(const std::vector<Entity>& computers) {
    GroupedEntities out;
    for (std::size_t i = 0; i < computers.size(); ++i) {
        auto os = computers[i].first_string("operatingSystem");
        out.add(os ? *os : UNKNOWN_KEY, i);
    }
    return out;
}

std::string MembershipFault::message() const {
    switch (kind) {
    case MembershipFaultKind::MissingPrimaryGroupId:
        return "user '" + user_dn + "' has no usable primaryGroupID";
    case MembershipFaultKind::UnresolvedPrimaryGroup:
        return "primary group " + std::to_string(primary_group_id) + " of user '" + user_dn +
               "' is not in the group RID map (stale or partial group list)";
    }
    return "user '" + user_dn + "': membership fault";
}

Membership group_by_membership(const std::vector<Entity>& users, const identity::RidMap& rid_map,
                               UnresolvedGroupPolicy policy) {
    Membership out;
    for (std::size_t i = 0; i < users.size(); ++i) {
        const Entity& user = users[i];
        std::vector<std::string> names;

        // memberOf отсутствует, если пользователь состоит только в primary group
        if (auto member_of = user.strings("memberOf")) {
            for (const auto& dn : *member_of) {
                try {
                    names.push_back(identity::cn_from_dn(dn));
                } catch (const identity::DnParseError&) {
                    names.push_back(dn);
                }
            }
        }

        std::optional<std::string> primary;
        auto gid = user.integer("primaryGroupID");
        if (!gid) {
            out.faults.push_back({MembershipFaultKind::MissingPrimaryGroupId, user.dn(), 0});
        } else {
            constexpr auto max_rid =
                static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max());
            if (*gid >= 0 && *gid <= max_rid) {
                primary = rid_map.lookup(static_cast<std::uint32_t>(*gid));
            }
            if (!primary) {
                out.faults.push_back(
                    {MembershipFaultKind::UnresolvedPrimaryGroup, user.dn(), *gid});
            }
        }

        if (primary) {
            names.push_back(*primary);
        } else if (policy == UnresolvedGroupPolicy::Unknown) {
            names.push_back(UNKNOWN_KEY);
        }

        for (const auto& name : names) {
            out.groups.add(name, i);
        }
    }
    return out;
}

}  // namespace domaindump::index
