#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <cstdint>
#include <fstream>
#include <istream>
#include <map>
#include <optional>
#include <string>

/**
 * @brief Minimal INI reader/writer: [section] headers, key = value pairs,
 * ';' and '#' comment lines.
 */
class IniConfig {
public:
    bool load(const std::string &filename);
    void parse(std::istream &input);
    bool save(const std::string &filename) const;

    std::string getValue(const std::string &section, const std::string &key,
                         const std::string &default_value = "") const;
    std::optional<std::string> findValue(const std::string &section, const std::string &key) const;
    void setValue(const std::string &section, const std::string &key, const std::string &value);
    bool hasValue(const std::string &section, const std::string &key) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
