// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <string.h>
#include <string>

#include <MicroCentral.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

#include <MicroCentral/Core/FilesystemAdapter.h>
#include <MicroCentral/Core/FilesystemUtils.h>
#include <MicroCentral/Core/Configuration.h>
#include <MicroCentral/Core/ConfigurationContainer.h>

using namespace MicroCentral;

TEST_CASE( "Configuration" ) {
    printf("\nRun %s\n",  "Configuration");

    //clean state
    configuration_deinit();
    auto filesystem = makeDefaultFilesystemAdapter(FilesystemOpt::Use_Mount);
    FilesystemUtils::remove_if(filesystem, [] (const char*) {return true;});

    SECTION("Basic container operations") {
        auto container = makeConfigurationContainerVolatile(CONFIGURATION_VOLATILE "/volatile1");

        //check emptyness
        REQUIRE( container->size() == 0 );

        auto configInt = container->createConfiguration(TConfig::Int, "cInt");
        REQUIRE( configInt );
        configInt->setInt(42);

        auto configString = container->createConfiguration(TConfig::String, "cString");
        REQUIRE( configString );
        REQUIRE( configString->setString("mValue") );

        REQUIRE( container->size() == 2 );
        REQUIRE( container->getConfiguration("cInt")->getInt() == 42 );
        REQUIRE( !strcmp(container->getConfiguration("cString")->getString(), "mValue") );
        REQUIRE( container->getConfiguration("cUnknown") == nullptr );

        container->remove(configInt.get());
        REQUIRE( container->size() == 1 );
        REQUIRE( container->getConfiguration("cInt") == nullptr );
    }

    SECTION("Declare and load") {
        REQUIRE( configuration_init(filesystem) );

        auto heartbeatInterval = declareConfiguration<int>(MC_CONFIG_HEARTBEAT_INTERVAL, 300);
        auto listenUrl = declareConfiguration<const char*>(MC_CONFIG_LISTEN_URL, "http://0.0.0.0:9000");
        REQUIRE( heartbeatInterval );
        REQUIRE( listenUrl );
        REQUIRE( heartbeatInterval->getInt() == 300 );
        REQUIRE( !strcmp(listenUrl->getString(), "http://0.0.0.0:9000") );

        //declaring again returns the same configuration
        auto heartbeatInterval2 = declareConfiguration<int>(MC_CONFIG_HEARTBEAT_INTERVAL, 120);
        REQUIRE( heartbeatInterval2.get() == heartbeatInterval.get() );
        REQUIRE( heartbeatInterval2->getInt() == 300 );

        //missing file is created on first load
        REQUIRE( configuration_load() );
        size_t size = 0;
        REQUIRE( filesystem->stat(CONFIGURATION_FN, &size) == 0 );
        REQUIRE( size > 0 );

        heartbeatInterval->setInt(60);
        listenUrl->setString("http://127.0.0.1:8080");
        REQUIRE( configuration_save() );

        auto doc = FilesystemUtils::loadJson(filesystem, CONFIGURATION_FN);
        REQUIRE( doc );
        REQUIRE( !strcmp((*doc)["head"]["content-type"] | "", "mc_config_file") );
        REQUIRE( !strcmp((*doc)["head"]["version"] | "", "1.0") );
        REQUIRE( (*doc)["configurations"].as<JsonArray>().size() == 2 );

        configuration_deinit();

        //restart
        REQUIRE( configuration_init(filesystem) );
        heartbeatInterval = declareConfiguration<int>(MC_CONFIG_HEARTBEAT_INTERVAL, 300);
        listenUrl = declareConfiguration<const char*>(MC_CONFIG_LISTEN_URL, "http://0.0.0.0:9000");
        REQUIRE( heartbeatInterval->getInt() == 300 );

        REQUIRE( configuration_load() );
        REQUIRE( heartbeatInterval->getInt() == 60 );
        REQUIRE( !strcmp(listenUrl->getString(), "http://127.0.0.1:8080") );

        //the loaded value is kept when declaring again
        REQUIRE( declareConfiguration<int>(MC_CONFIG_HEARTBEAT_INTERVAL, 300).get() == heartbeatInterval.get() );
        REQUIRE( heartbeatInterval->getInt() == 60 );
    }

    SECTION("Corrupt file") {
        auto corrupt = makeJsonDoc("test", 256);
        REQUIRE( corrupt );
        (*corrupt)["head"]["content-type"] = "something_else";
        REQUIRE( FilesystemUtils::storeJson(filesystem, CONFIGURATION_FN, *corrupt) );

        REQUIRE( configuration_init(filesystem) );
        auto heartbeatInterval = declareConfiguration<int>(MC_CONFIG_HEARTBEAT_INTERVAL, 300);
        REQUIRE( !configuration_load() );
        REQUIRE( heartbeatInterval->getInt() == 300 );
    }

    SECTION("Volatile configurations") {
        REQUIRE( configuration_init(filesystem) );

        auto config = declareConfiguration<bool>("VolatileFlag", true, CONFIGURATION_VOLATILE "/flags");
        REQUIRE( config );
        REQUIRE( config->getBool() );
        config->setBool(false);
        REQUIRE( configuration_save() );

        size_t size = 0;
        REQUIRE( filesystem->stat(MC_FILENAME_PREFIX "flags", &size) != 0 );
    }

    SECTION("Type conflict") {
        auto configInt = declareConfiguration<int>("ConflictKey", 1, CONFIGURATION_VOLATILE "/conflict");
        REQUIRE( configInt );

        auto configBool = declareConfiguration<bool>("ConflictKey", true, CONFIGURATION_VOLATILE "/conflict");
        REQUIRE( configBool );
        REQUIRE( configBool->getType() == TConfig::Bool );
        REQUIRE( configBool->getBool() );

        //accessors of another type report the default
        REQUIRE( configBool->getInt() == 0 );
        REQUIRE( !configBool->setString("x") );
    }

    SECTION("String limit") {
        auto config = declareConfiguration<const char*>("LongValue", "short", CONFIGURATION_VOLATILE "/strings");
        REQUIRE( config );

        std::string tooLong (MC_CONFIG_MAX_VALSTRSIZE, 'x');
        REQUIRE( !config->setString(tooLong.c_str()) );
        REQUIRE( !strcmp(config->getString(), "short") );

        //factory default which does not fit
        REQUIRE( declareConfiguration<const char*>("LongDefault", tooLong.c_str(), CONFIGURATION_VOLATILE "/strings") == nullptr );
    }

    SECTION("Validators") {
        REQUIRE( VALIDATE_UNSIGNED_INT("300") );
        REQUIRE( !VALIDATE_UNSIGNED_INT("-1") );
        REQUIRE( !VALIDATE_UNSIGNED_INT("1.5") );
        REQUIRE( !VALIDATE_UNSIGNED_INT("") );

        registerConfigurationValidator("Checked", [] (const char *v) {return !strcmp(v, "ok");});
        auto validator = getConfigurationValidator("Checked");
        REQUIRE( validator != nullptr );
        REQUIRE( (*validator)("ok") );
        REQUIRE( !(*validator)("nok") );
        REQUIRE( getConfigurationValidator("Unchecked") == nullptr );
    }

    SECTION("Invalid server configuration") {
        REQUIRE( configuration_init(filesystem) );

        auto callTimeout = declareConfiguration<int>(MC_CONFIG_CALL_TIMEOUT, 30);
        auto heartbeatInterval = declareConfiguration<int>(MC_CONFIG_HEARTBEAT_INTERVAL, 300);
        auto heartbeatTimeoutFactor = declareConfiguration<int>(MC_CONFIG_HEARTBEAT_TIMEOUT_FACTOR, 3);
        callTimeout->setInt(0);
        heartbeatInterval->setInt(-5);
        heartbeatTimeoutFactor->setInt(0); //disables supervision; valid

        CentralSystem centralSystem {makeSeededStore()};
        REQUIRE( centralSystem.setup() );

        REQUIRE( callTimeout->getInt() == 30 );
        REQUIRE( heartbeatInterval->getInt() == 300 );
        REQUIRE( heartbeatTimeoutFactor->getInt() == 0 );
    }

    configuration_deinit();
    FilesystemUtils::remove_if(filesystem, [] (const char*) {return true;});
}
