#pragma once

#include "hotupdate/update_state.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>

namespace hotupdate {

class IStateStore {
public:
    virtual ~IStateStore() = default;
    // Always yields a usable, healed state; a failure result only reports
    // that the stored record was replaced by the default.
    virtual Result Load(UpdateState& out) = 0;
    virtual Result Save(const UpdateState& state) = 0;
};

// Flat key/value record, one key per logical field.
nlohmann::json EncodeState(const UpdateState& state);
std::expected<UpdateState, std::string> DecodeState(const nlohmann::json& j,
                                                    const std::string& bundle_version);

class JsonFileStateStore final : public IStateStore {
public:
    JsonFileStateStore(std::string path, std::string bundle_version)
        : path_(std::move(path)), bundle_version_(std::move(bundle_version)) {}

    Result Load(UpdateState& out) override;
    Result Save(const UpdateState& state) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    std::string bundle_version_;
};

} // namespace hotupdate
