#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class JsonParse {
  public:
    int GetInt(const nlohmann::json &j, const std::string &key, int fallback);
    bool GetBool(const nlohmann::json &j, const std::string &key, bool fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);
    std::vector<int> GetIntArray(const nlohmann::json &j, const std::string &key);
    std::vector<std::string> JsonArray2String(const nlohmann::json &arr);

    // Objects are merged key by key, every other value in `patch` replaces the one in `base`.
    void DeepMerge(nlohmann::json &base, const nlohmann::json &patch);
};
