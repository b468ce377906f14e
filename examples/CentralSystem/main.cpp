// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#include <MicroCentral.h>
#include <MicroCentral/Server/MongooseServer.h>

#include <signal.h>
#include <string>

using namespace MicroCentral;

namespace {
volatile sig_atomic_t running = 1;

void onSignal(int) {
    running = 0;
}
}

int main(int argc, char **argv) {

    auto filesystem = makeDefaultFilesystemAdapter(FilesystemOpt::Use_Mount);
    if (!configuration_init(filesystem)) {
        MC_DBG_ERR("cannot initialize configuration");
        return 1;
    }

    auto listenUrlString = declareConfiguration<const char*>(MC_CONFIG_LISTEN_URL, "http://0.0.0.0:9000");
    auto seedFileString = declareConfiguration<const char*>(MC_CONFIG_STORE_SEED_FILE, "mc-seed.jsn");

    auto store = std::make_shared<MemoryStore>();

    {
        CentralSystem centralSystem {store};

        //load the stored values after all configurations have been declared
        if (!configuration_load()) {
            MC_DBG_WARN("no stored configuration, use defaults");
        }
        configuration_save();

        std::string seedFn = MC_FILENAME_PREFIX;
        if (argc >= 2) {
            seedFn = argv[1];
        } else if (seedFileString) {
            seedFn += seedFileString->getString();
        }

        if (!StoreLoader::loadSeed(filesystem, seedFn.c_str(), *store)) {
            MC_DBG_ERR("cannot load seed %s", seedFn.c_str());
            configuration_deinit();
            return 1;
        }

        if (!centralSystem.setup()) {
            configuration_deinit();
            return 1;
        }

        MongooseServer server {centralSystem};
        if (!server.listen(listenUrlString ? listenUrlString->getString() : "http://0.0.0.0:9000")) {
            configuration_deinit();
            return 1;
        }

        signal(SIGINT, onSignal);
        signal(SIGTERM, onSignal);

        while (running) {
            server.poll(50);
            centralSystem.loop();
        }

        MC_DBG_INFO("shutting down");
        centralSystem.shutdown();

        //flush the close frames
        for (int i = 0; i < 10; i++) {
            server.poll(20);
        }
    }

    configuration_deinit();
    return 0;
}
