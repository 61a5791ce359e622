#pragma once

#include <memory>
#include <string>

#include "internal/batch/announcement_source.hpp"
#include "internal/batch/batch_writer.hpp"
#include "internal/crypto/signer.hpp"
#include "internal/storage/content_store.hpp"

namespace dsnp {

/*
  Collaborators and settings shared by SDK operations.

  Every operation takes a context explicitly; the process-wide default
  exists for applications that only ever need one. Unset collaborators
  are reported with util::MissingCollaborator when an operation needs them.
*/
struct SdkContext {
  storage::ContentStorePtr            store;
  crypto::SignerPtr                   signer;
  crypto::PermissionResolverPtr       permissions;
  crypto::ContentFetcherPtr           fetcher;

  batch::BatchOptions batch_options;

  // DSNP user id announcements are published from.
  std::string from_id;
};

storage::ContentStore&           RequireStore(const SdkContext& context);
crypto::Signer&                  RequireSigner(const SdkContext& context);
const crypto::PermissionResolver& RequirePermissions(const SdkContext& context);
const std::string&               RequireFromId(const SdkContext& context);

// ------------------------------------------------------------------
// Default context
// ------------------------------------------------------------------
void SetDefaultContext(SdkContext context);

// Snapshot of the default; empty until SetDefaultContext is called.
std::shared_ptr<const SdkContext> DefaultContext();

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------
batch::BatchArtifact CreateBatch(const std::string& key, batch::AnnouncementSource& source, const SdkContext& context);
batch::BatchArtifact CreateBatch(const std::string& key, batch::AnnouncementSource& source);

} // namespace dsnp
