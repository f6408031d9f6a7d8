#pragma once

#include "server_options.h"

#include "kitquote/catalog_store.h"
#include "kitquote/checkout.h"

#include <httplib.h>

using namespace KitQuote;

struct ServerContext {
    httplib::Server& server;
    const ServerOptions& options;
    CatalogStore& store;
    const CheckoutAssembler& assembler;
};
