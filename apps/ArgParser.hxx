#ifndef STITCHING_ARGPARSER_HXX
#define STITCHING_ARGPARSER_HXX

#include <cstdlib>
#include <iostream>
#include <map>
#include <string>

/*
 * key=value command line arguments
 */
class ArgParser
{
public:
    enum Type {Integer, String};

    struct Key {
        Key() : type(String), required(false) {}
        Key(std::string k, Type t, std::string desc, bool required)
                : key(k), type(t), description(desc), required(required) {}
        std::string key;
        Type type;
        std::string description;
        bool required;
    };

    ArgParser(int argc, char** argv) : argc_(argc), argv_(argv) {}

    void addRequiredArg(std::string key, Type type, std::string description)
    {
        args_[key] = Key(key, type, description, true);
    }

    void addOptionalArg(std::string key, Type type, std::string description)
    {
        args_[key] = Key(key, type, description, false);
    }

    bool hasKey(std::string key) const
    {
        return values_.find(key) != values_.end();
    }

    void usage() const
    {
        std::cerr << "usage: " << argv_[0] << std::endl;
        for (std::map<std::string, Key>::const_iterator it = args_.begin(); it != args_.end(); ++it) {
            std::cerr << "\t\t" << (!it->second.required ? "[" : "") << it->first << "="
                      << (it->second.type == Integer ? "integer" : "string")
                      << (!it->second.required ? "]" : "")
                      << "\t" << it->second.description << std::endl;
        }
    }

    // false on unknown keys, malformed tokens or missing required keys
    bool parse()
    {
        for (int i = 1; i < argc_; i++) {
            std::string token = argv_[i];
            std::string::size_type pos = token.find_first_of('=');
            if (pos == std::string::npos) {
                std::cerr << "argument " << token << " is not of the form key=value" << std::endl;
                return false;
            }

            std::string key = token.substr(0, pos);
            std::string value = token.substr(pos + 1);
            if (args_.find(key) == args_.end()) {
                std::cerr << "key " << key << " is not allowed" << std::endl;
                return false;
            }
            if (value.size() >= 2 && value[0] == '"' && value[value.size()-1] == '"')
                value = value.substr(1, value.size() - 2);
            values_[key] = value;
        }

        for (std::map<std::string, Key>::const_iterator it = args_.begin(); it != args_.end(); ++it) {
            if (it->second.required && !hasKey(it->first)) {
                std::cerr << "required key " << it->first << " not present" << std::endl;
                return false;
            }
        }
        return true;
    }

    std::string getString(std::string key, std::string fallback = "") const
    {
        std::map<std::string, std::string>::const_iterator it = values_.find(key);
        return it == values_.end() ? fallback : it->second;
    }

    int getInt(std::string key, int fallback = 0) const
    {
        std::map<std::string, std::string>::const_iterator it = values_.find(key);
        return it == values_.end() ? fallback : atoi(it->second.c_str());
    }

private:
    std::map<std::string, Key> args_;
    std::map<std::string, std::string> values_;

    int argc_;
    char** argv_;
};

#endif /* STITCHING_ARGPARSER_HXX */
