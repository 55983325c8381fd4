#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <fstream>
#include <map>
#include <string>
#include <vector>

// Minimal section/key/value INI store. Keys keep their case; lines starting with ';' or '#' are comments.
class IniConfig
{
public:
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section, const std::string& key,
                         const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    bool hasValue(const std::string& section, const std::string& key) const;
    void removeValue(const std::string& section, const std::string& key);

    std::vector<std::string> sections() const;
    void clear();

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif // INICONFIG_HPP
