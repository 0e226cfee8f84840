#include "hotupdate/update_state.hpp"

#include "util/version_comparator.hpp"

#include <algorithm>
#include <type_traits>

namespace hotupdate {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

// Whether `version` may still be installed on top of `state`.
bool IsEligiblePending(const UpdateState& state, const std::string& version) {
    return !version.empty() &&
           VersionComparator::IsNewer(version, state.meta.installed_version) &&
           !state.IsIgnored(version);
}

} // namespace

std::string_view PhaseName(const LifecyclePhase& p) {
    return std::visit(Overloaded{
                          [](const phase::Idle&) { return std::string_view("idle"); },
                          [](const phase::Downloading&) { return std::string_view("downloading"); },
                          [](const phase::Staged&) { return std::string_view("staged"); },
                          [](const phase::CanaryPending&) { return std::string_view("canary_pending"); },
                      },
                      p);
}

UpdateState UpdateState::Initial(const std::string& bundle_version) {
    UpdateState s;
    s.meta.installed_version = bundle_version;
    s.meta.version_history.push_back(bundle_version);
    return s;
}

std::optional<std::string> UpdateState::PendingVersion() const {
    if (const auto* staged = std::get_if<phase::Staged>(&phase))
        return staged->version;
    if (const auto* dl = std::get_if<phase::Downloading>(&phase))
        return dl->prior_staged;
    return std::nullopt;
}

std::optional<std::string> UpdateState::CanaryVersion() const {
    if (const auto* canary = std::get_if<phase::CanaryPending>(&phase))
        return canary->version;
    return std::nullopt;
}

std::optional<std::string> UpdateState::DownloadingVersion() const {
    if (const auto* dl = std::get_if<phase::Downloading>(&phase))
        return dl->version;
    return std::nullopt;
}

bool UpdateState::DownloadInProgress() const {
    return std::holds_alternative<phase::Downloading>(phase);
}

bool UpdateState::IsIgnored(const std::string& version) const {
    return std::any_of(meta.ignore_list.begin(), meta.ignore_list.end(), [&](const std::string& v) {
        return VersionComparator::Equivalent(v, version);
    });
}

void UpdateState::AddIgnored(const std::string& version) {
    if (!IsIgnored(version))
        meta.ignore_list.insert(version);
}

bool UpdateState::RemoveIgnored(const std::string& version) {
    const auto removed = std::erase_if(meta.ignore_list, [&](const std::string& v) {
        return VersionComparator::Equivalent(v, version);
    });
    return removed > 0;
}

void UpdateState::AddToHistory(const std::string& version) {
    auto& h = meta.version_history;
    if (std::find(h.begin(), h.end(), version) == h.end())
        h.push_back(version);
}

void UpdateState::RemoveFromHistory(const std::string& version) {
    std::erase(meta.version_history, version);
}

std::vector<std::string> HealState(UpdateState& state) {
    std::vector<std::string> repairs;
    const std::string& installed = state.meta.installed_version;

    if (state.RemoveIgnored(installed)) {
        repairs.push_back("installed version " + installed + " removed from ignore list");
    }

    if (state.meta.previous_version &&
        (state.meta.previous_version->empty() ||
         VersionComparator::Equivalent(*state.meta.previous_version, installed))) {
        repairs.push_back("previous version cleared (same as installed)");
        state.meta.previous_version.reset();
    }

    std::visit(Overloaded{
                   [](phase::Idle&) {},
                   [&](phase::Downloading& dl) {
                       if (dl.prior_staged && !IsEligiblePending(state, *dl.prior_staged)) {
                           repairs.push_back("stale staged version " + *dl.prior_staged + " dropped");
                           dl.prior_staged.reset();
                       }
                       if (!IsEligiblePending(state, dl.version)) {
                           repairs.push_back("download of ineligible version " + dl.version + " dropped");
                           if (dl.prior_staged) {
                               state.phase = phase::Staged{*dl.prior_staged};
                           } else {
                               state.phase = phase::Idle{};
                           }
                       }
                   },
                   [&](phase::Staged& staged) {
                       if (!IsEligiblePending(state, staged.version)) {
                           repairs.push_back("staged version " + staged.version +
                                             " is not newer than " + installed + " or is ignored");
                           state.phase = phase::Idle{};
                       }
                   },
                   [&](phase::CanaryPending& canary) {
                       if (canary.version != installed) {
                           repairs.push_back("canary version " + canary.version +
                                             " does not match installed " + installed);
                           state.phase = phase::Idle{};
                       }
                   },
               },
               state.phase);

    return repairs;
}

} // namespace hotupdate
