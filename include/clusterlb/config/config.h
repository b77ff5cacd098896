#pragma once

#include <string>
#include <string_view>

#include <clusterlb/core/status.h>

#include <chjson/chjson.hpp>

namespace clusterlb::config {

class Config {
public:
    static clusterlb::Result<Config> LoadFile(std::string path);
    static clusterlb::Result<Config> LoadString(std::string_view text);

    bool Has(std::string_view key) const;

    clusterlb::Result<std::string> GetString(std::string_view key) const;
    clusterlb::Result<int> GetInt(std::string_view key) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    chjson::document doc_;
};

} // namespace clusterlb::config
