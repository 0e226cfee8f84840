#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hotupdate {

namespace phase {

struct Idle {};

struct Downloading {
    std::string version;
    // Previously staged version kept until the new one replaces it.
    std::optional<std::string> prior_staged;
};

struct Staged {
    std::string version;
};

struct CanaryPending {
    std::string version;
};

} // namespace phase

using LifecyclePhase =
    std::variant<phase::Idle, phase::Downloading, phase::Staged, phase::CanaryPending>;

std::string_view PhaseName(const LifecyclePhase& p);

struct VersionMetadata {
    std::string installed_version;
    std::optional<std::string> previous_version;
    std::set<std::string> ignore_list;
    // Installed versions, oldest first.
    std::vector<std::string> version_history;
};

struct UpdateState {
    VersionMetadata meta;
    LifecyclePhase phase = phase::Idle{};

    static UpdateState Initial(const std::string& bundle_version);

    // Version staged and ready to install, also while a newer download runs.
    std::optional<std::string> PendingVersion() const;
    std::optional<std::string> CanaryVersion() const;
    std::optional<std::string> DownloadingVersion() const;
    bool DownloadInProgress() const;
    bool PendingUpdateReady() const { return PendingVersion().has_value(); }

    // Membership by version equality, so "2.0" matches an ignored "2.0.0".
    bool IsIgnored(const std::string& version) const;
    void AddIgnored(const std::string& version);
    bool RemoveIgnored(const std::string& version);

    void AddToHistory(const std::string& version);
    void RemoveFromHistory(const std::string& version);
};

// Repairs the pure (disk independent) invariants in place and returns a
// description of each repair; empty when the state was already consistent.
std::vector<std::string> HealState(UpdateState& state);

} // namespace hotupdate
