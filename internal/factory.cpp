#include "factory.hpp"

#include <stdexcept>

#include "internal/announcement/identifiers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/storage_factory.hpp"

namespace dsnp::factory {

batch::BatchOptions BuildBatchOptions(const dsnp::runtime::config::BatchConfig& config) {
  batch::BatchOptions options;
  options.compression            = storage::common::ResolveCompression(config.compression());
  options.validate_rows          = !config.skip_row_validation();
  if (config.max_rows_per_row_group() != 0) {
    options.max_rows_per_row_group = config.max_rows_per_row_group();
  }

  if (config.has_bloom_filter()) {
    if (config.bloom_filter().ndv() != 0) options.bloom_filter_ndv = config.bloom_filter().ndv();
    if (config.bloom_filter().fpp() != 0.0) options.bloom_filter_fpp = config.bloom_filter().fpp();
  }
  if (!config.content_digest().empty()) {
    options.content_digest = config.content_digest();
  }
  return options;
}

/*
    Build the SDK context from runtime config
*/
SdkContext BuildContext(const dsnp::runtime::config::RuntimeConfig& config) {
  observability::InitializeLogging(config.logging());

  // ------------------------------------------------------------------
  // Storage backend
  // ------------------------------------------------------------------
  SdkContext context;
  context.store = storage::StorageFactory::Build(config.storage());

  // ------------------------------------------------------------------
  // Batch codec + identity
  // ------------------------------------------------------------------
  context.batch_options = BuildBatchOptions(config.batch());
  context.from_id       = config.identity().from_id();

  if (!context.from_id.empty() && !announcement::IsDsnpUserId(context.from_id)) {
    throw std::runtime_error("Invalid configuration: identity.from_id is not a DSNP user id: " + context.from_id);
  }

  DSNP_LOG_INFO("sdk context built",
                {observability::StringField("storage_backend", config.storage().has_disk()     ? "disk"
                                                               : config.storage().has_object() ? "object"
                                                                                               : "memory"),
                 observability::StringField("content_digest", context.batch_options.content_digest),
                 observability::BoolField("validate_rows", context.batch_options.validate_rows)});
  return context;
}

} // namespace dsnp::factory
