#include "utils/ConfigLoader.hpp"
#include "utils/StringUtils.hpp"

#include <fstream>
#include <stdexcept>

namespace GcTriage
{
    namespace Utils
    {
        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                // Could not open file; keep existing config as-is.
                return false;
            }

            loadFromStream(in);
            return true;
        }

        void ConfigLoader::loadFromStream(std::istream &in)
        {
            std::unordered_map<std::string, std::string> newValues;

            std::string line;
            while (std::getline(in, line))
            {
                const std::string_view content = trim(line);
                if (content.empty() || content[0] == '#' || content[0] == ';')
                {
                    continue;
                }

                const auto pos = content.find('=');
                if (pos == std::string_view::npos)
                {
                    continue;
                }

                std::string key(trim(content.substr(0, pos)));
                std::string value(trim(content.substr(pos + 1)));
                if (key.empty())
                {
                    continue;
                }

                // Last occurrence wins if key is repeated.
                newValues[std::move(key)] = std::move(value);
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &[key, value] : newValues)
            {
                m_values[key] = std::move(value);
            }
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(std::string(key)) != m_values.end();
        }

        std::optional<std::string> ConfigLoader::getRawUnlocked(std::string_view key) const
        {
            auto it = m_values.find(std::string(key));
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return getRawUnlocked(key);
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            auto v = getString(key);
            return v ? *v : std::string(defaultValue);
        }

        std::optional<int> ConfigLoader::getInt(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }

            try
            {
                std::size_t idx = 0;
                int value       = std::stoi(*v, &idx);
                if (idx != v->size())
                {
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::invalid_argument &)
            {
                return std::nullopt;
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }
        }

        int ConfigLoader::getIntOr(std::string_view key, int defaultValue) const
        {
            auto v = getInt(key);
            return v ? *v : defaultValue;
        }

        std::optional<double> ConfigLoader::getDouble(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }

            try
            {
                std::size_t idx = 0;
                double value    = std::stod(*v, &idx);
                if (idx != v->size())
                {
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::invalid_argument &)
            {
                return std::nullopt;
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }
        }

        double ConfigLoader::getDoubleOr(std::string_view key,
                                         double defaultValue) const
        {
            auto v = getDouble(key);
            return v ? *v : defaultValue;
        }

        std::optional<bool> ConfigLoader::getBool(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }

            const std::string s = toLower(trim(*v));
            if (s == "1" || s == "true" || s == "yes" || s == "on")
            {
                return true;
            }
            if (s == "0" || s == "false" || s == "no" || s == "off")
            {
                return false;
            }
            return std::nullopt;
        }

        bool ConfigLoader::getBoolOr(std::string_view key, bool defaultValue) const
        {
            auto v = getBool(key);
            return v ? *v : defaultValue;
        }

        std::size_t ConfigLoader::size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.size();
        }

    } // namespace Utils
} // namespace GcTriage
