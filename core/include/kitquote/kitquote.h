#pragma once

/// \file kitquote.h
/// \brief Umbrella header, includes every public header in KitQuote.

#include "kitquote/version.h"
#include "export.h"
#include "error.h"
#include "common.h"
#include "coverage.h"
#include "bucket_optimizer.h"
#include "commerce.h"
#include "catalog.h"
#include "catalog_store.h"
#include "role_resolver.h"
#include "pricing.h"
#include "checkout.h"
#include "shopify_client.h"
#include "logging.h"
