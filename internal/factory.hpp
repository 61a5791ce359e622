#pragma once

#include "config/config.pb.h"

#include "internal/batch/batch_writer.hpp"
#include "internal/context/sdk_context.hpp"

namespace dsnp::factory {

/*
  BuildContext

  Composition root: initializes logging, builds the configured content
  store and batch options, and copies the publishing identity.

  Signer, permission resolver and content fetcher are application
  supplied and left unset here.
*/
SdkContext BuildContext(const dsnp::runtime::config::RuntimeConfig& config);

batch::BatchOptions BuildBatchOptions(const dsnp::runtime::config::BatchConfig& config);

} // namespace dsnp::factory
