// matth-x/MicroCentral
// Copyright Matthias Akstaller 2019 - 2026
// MIT License

#ifndef MC_MICROCENTRAL_H
#define MC_MICROCENTRAL_H

#include <MicroCentral/Core/Configuration.h>
#include <MicroCentral/Core/Connection.h>
#include <MicroCentral/Core/FilesystemAdapter.h>
#include <MicroCentral/Core/Time.h>
#include <MicroCentral/Model/Model.h>
#include <MicroCentral/Model/Authorization/AuthorizationService.h>
#include <MicroCentral/Model/Payments/PaymentSyncService.h>
#include <MicroCentral/Model/Sessions/SessionService.h>
#include <MicroCentral/Model/Store/MemoryStore.h>
#include <MicroCentral/Model/Store/Store.h>
#include <MicroCentral/Model/Store/StoreLoader.h>
#include <MicroCentral/Model/Tariffs/TariffService.h>
#include <MicroCentral/Server/CentralSystem.h>
#include <MicroCentral/Server/ChargePointSession.h>
#include <MicroCentral/Server/ConnectionRegistry.h>
#include <MicroCentral/Version.h>
#include <MicroCentral/Debug.h>

/*
 * Basic integration
 *
 *     auto filesystem = MicroCentral::makeDefaultFilesystemAdapter(MicroCentral::FilesystemOpt::Use_Mount);
 *     MicroCentral::configuration_init(filesystem);
 *
 *     auto store = std::make_shared<MicroCentral::MemoryStore>();
 *     MicroCentral::StoreLoader::loadSeed(filesystem, MC_FILENAME_PREFIX "mc-seed.jsn", *store);
 *
 *     MicroCentral::CentralSystem centralSystem {store};
 *     MicroCentral::configuration_load();
 *     centralSystem.setup();
 *
 *     MicroCentral::MongooseServer server {centralSystem};  //<MicroCentral/Server/MongooseServer.h>
 *     server.listen("http://0.0.0.0:9000");
 *     for (;;) {
 *         server.poll(50);
 *         centralSystem.loop();
 *     }
 */

#endif
