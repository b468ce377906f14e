// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral/Core/ConfigurationKeyValue.h>
#include <MicroCentral/Debug.h>

#include <string.h>
#include <atomic>

namespace MicroCentral {

template<> TConfig convertType<int>() {return TConfig::Int;}
template<> TConfig convertType<bool>() {return TConfig::Bool;}
template<> TConfig convertType<const char*>() {return TConfig::String;}

Configuration::~Configuration() {

}

void Configuration::setInt(int) {
    MC_DBG_ERR("%s: type err", getKey());
}

void Configuration::setBool(bool) {
    MC_DBG_ERR("%s: type err", getKey());
}

bool Configuration::setString(const char*) {
    MC_DBG_ERR("%s: type err", getKey());
    return false;
}

int Configuration::getInt() {
    MC_DBG_ERR("%s: type err", getKey());
    return 0;
}

bool Configuration::getBool() {
    MC_DBG_ERR("%s: type err", getKey());
    return false;
}

const char *Configuration::getString() {
    MC_DBG_ERR("%s: type err", getKey());
    return "";
}

namespace {

/*
 * Int and bool values are read by every session worker, so they are kept in atomics. String
 * values are only written during startup
 */

class ConfigInt : public Configuration {
private:
    std::atomic<int> val {0};
public:
    ConfigInt(const char *key) : Configuration(key) { }

    TConfig getType() override {return TConfig::Int;}

    void setInt(int val) override {
        this->val = val;
        value_revision++;
    }

    int getInt() override {return val;}
};

class ConfigBool : public Configuration {
private:
    std::atomic<bool> val {false};
public:
    ConfigBool(const char *key) : Configuration(key) { }

    TConfig getType() override {return TConfig::Bool;}

    void setBool(bool val) override {
        this->val = val;
        value_revision++;
    }

    bool getBool() override {return val;}
};

class ConfigString : public Configuration {
private:
    std::string val;
public:
    ConfigString(const char *key) : Configuration(key) { }

    TConfig getType() override {return TConfig::String;}

    bool setString(const char *src) override {
        if (!src) {
            src = "";
        }

        if (!val.compare(src)) {
            return true;
        }

        if (strlen(src) + 1 > MC_CONFIG_MAX_VALSTRSIZE) {
            MC_DBG_WARN("%s: value exceeds %i characters", getKey(), MC_CONFIG_MAX_VALSTRSIZE - 1);
            return false;
        }

        value_revision++;
        val = src;
        return true;
    }

    const char *getString() override {return val.c_str();}
};

} //namespace

std::unique_ptr<Configuration> makeConfiguration(TConfig type, const char *key) {
    switch (type) {
        case TConfig::Int:
            return std::unique_ptr<Configuration>(new ConfigInt(key));
        case TConfig::Bool:
            return std::unique_ptr<Configuration>(new ConfigBool(key));
        case TConfig::String:
            return std::unique_ptr<Configuration>(new ConfigString(key));
    }
    MC_DBG_ERR("unknown type for %s", key);
    return nullptr;
}

bool deserializeTConfig(const char *serialized, TConfig& out) {
    if (!strcmp(serialized, "int")) {
        out = TConfig::Int;
    } else if (!strcmp(serialized, "bool")) {
        out = TConfig::Bool;
    } else if (!strcmp(serialized, "string")) {
        out = TConfig::String;
    } else {
        MC_DBG_WARN("config type error");
        return false;
    }
    return true;
}

const char *serializeTConfig(TConfig type) {
    switch (type) {
        case TConfig::Int:
            return "int";
        case TConfig::Bool:
            return "bool";
        case TConfig::String:
            return "string";
    }
    return "_Undefined";
}

} //end namespace MicroCentral
