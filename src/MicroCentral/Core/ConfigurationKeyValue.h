// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_CONFIGURATIONKEYVALUE_H
#define MC_CONFIGURATIONKEYVALUE_H

#include <stdint.h>
#include <memory>
#include <string>

#define MC_CONFIG_MAX_VALSTRSIZE 128

namespace MicroCentral {

using revision_t = uint16_t;

enum class TConfig : uint8_t {
    Int,
    Bool,
    String
};

template<class T>
TConfig convertType();

/*
 * Typed key-value pair of the server configuration. The setters and getters of the other types
 * log a type error
 */
class Configuration {
private:
    std::string key;
protected:
    revision_t value_revision = 0; //write access counter; used to check if this config has been changed
public:
    Configuration(const char *key) : key(key) { }
    virtual ~Configuration();

    const char *getKey() const {return key.c_str();}

    virtual void setInt(int);
    virtual void setBool(bool);
    virtual bool setString(const char*);

    virtual int getInt();
    virtual bool getBool();
    virtual const char *getString(); //always returns c-string (empty if undefined)

    virtual TConfig getType() = 0;

    revision_t getValueRevision() const {return value_revision;}
};

std::unique_ptr<Configuration> makeConfiguration(TConfig type, const char *key);

const char *serializeTConfig(TConfig type);
bool deserializeTConfig(const char *serialized, TConfig& out);

} //end namespace MicroCentral

#endif
