// src/common/env/EnvConfig.cpp
#include "EnvConfig.hpp"
#include "common/utils/logger/Logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace objfetch::env
{
    namespace
    {
        std::string Trim(const std::string& value, const char* whitespace = " \t\r\n")
        {
            size_t start = value.find_first_not_of(whitespace);
            if (start == std::string::npos) {
                return "";
            }
            size_t end = value.find_last_not_of(whitespace);
            return value.substr(start, end - start + 1);
        }

        uint32_t ParseUInt32(const std::string& key, const std::string& value)
        {
            try {
                size_t consumed = 0;
                unsigned long parsed = std::stoul(value, &consumed);
                if (consumed != value.size() || parsed > UINT32_MAX) {
                    throw std::out_of_range("Value out of range");
                }
                return static_cast<uint32_t>(parsed);
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid uint32 value for key '" + key + "': " + value);
            }
        }

        bool ParseBool(const std::string& key, std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            if (value == "true" || value == "1" || value == "yes" || value == "on") {
                return true;
            } else if (value == "false" || value == "0" || value == "no" || value == "off") {
                return false;
            }
            throw std::runtime_error("Invalid boolean value for key '" + key + "': " + value);
        }
    }

    bool EnvConfig::LoadFromFile(const std::string& file_path)
    {
        std::ifstream file(file_path);
        if (!file.is_open())
        {
            LOG_ERRORF("EnvConfig", "Failed to open config file: %s", file_path.c_str());
            return false;
        }
        config_map.clear();

        std::string line;
        size_t line_number = 0;
        while (std::getline(file, line))
        {
            ++line_number;
            if (!ParseLine(line)) {
                LOG_WARNF("EnvConfig", "Ignoring malformed line %zu in %s", line_number, file_path.c_str());
            }
        }

        is_loaded = true;
        LOG_INFOF("EnvConfig", "Loaded %zu configuration entries from %s", config_map.size(), file_path.c_str());
        return true;
    }

    bool EnvConfig::LoadFromEnv(const std::string& env_name)
    {
        env_type = env_name;
        return LoadFromFile("env/.env." + env_name);
    }

    std::string EnvConfig::GetString(const std::string& key) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            throw ConfigMissingException(key);
        }
        return it->second;
    }

    uint32_t EnvConfig::GetUInt32(const std::string& key) const
    {
        return ParseUInt32(key, GetString(key));
    }

    bool EnvConfig::GetBool(const std::string& key) const
    {
        return ParseBool(key, GetString(key));
    }

    std::string EnvConfig::GetStringOr(const std::string& key, const std::string& default_value) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            return default_value;
        }
        return it->second;
    }

    uint32_t EnvConfig::GetUInt32Or(const std::string& key, uint32_t default_value) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            return default_value;
        }
        return ParseUInt32(key, it->second);
    }

    bool EnvConfig::GetBoolOr(const std::string& key, bool default_value) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            return default_value;
        }
        return ParseBool(key, it->second);
    }

    std::vector<std::string> EnvConfig::GetStringArray(const std::string& key) const
    {
        std::string value = GetString(key);

        std::vector<std::string> result;
        std::stringstream ss(value);
        std::string item;

        while (std::getline(ss, item, ','))
        {
            item = Trim(item, " \t");
            if (!item.empty()) {
                result.push_back(item);
            }
        }

        if (result.empty()) {
            throw ConfigMissingException(key + " (array is empty)");
        }

        return result;
    }

    bool EnvConfig::HasKey(const std::string& key) const
    {
        return config_map.find(key) != config_map.end();
    }

    void EnvConfig::Set(const std::string& key, const std::string& value)
    {
        config_map[key] = value;
    }

    void EnvConfig::ValidateRequired(const std::vector<std::string>& required_keys) const
    {
        std::vector<std::string> missing_keys;

        for (const std::string& key : required_keys) {
            if (!HasKey(key) || config_map.at(key).empty()) {
                missing_keys.push_back(key);
            }
        }

        if (!missing_keys.empty()) {
            std::stringstream ss;
            ss << "Missing required configuration keys: ";
            for (size_t i = 0; i < missing_keys.size(); ++i) {
                ss << missing_keys[i];
                if (i < missing_keys.size() - 1) {
                    ss << ", ";
                }
            }
            throw std::runtime_error(ss.str());
        }
    }

    bool EnvConfig::ParseLine(const std::string& line)
    {
        std::string trimmed = Trim(line);

        // 빈 줄이나 주석은 무시
        if (trimmed.empty() || trimmed[0] == '#')
        {
            return true;
        }

        size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos)
        {
            return false;
        }

        std::string key = Trim(trimmed.substr(0, eq_pos), " \t");
        std::string value = Trim(trimmed.substr(eq_pos + 1), " \t");

        // 따옴표로 감싼 값은 벗겨낸다
        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                  (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (key.empty())
        {
            return false;
        }

        config_map[key] = value;
        return true;
    }
} // namespace objfetch::env
