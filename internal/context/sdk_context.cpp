#include "internal/context/sdk_context.hpp"

#include <mutex>
#include <utility>

#include "internal/util/errors.hpp"

namespace dsnp {

namespace {

std::mutex                        default_mutex;
std::shared_ptr<const SdkContext> default_context = std::make_shared<const SdkContext>();

} // namespace

storage::ContentStore& RequireStore(const SdkContext& context) {
  if (!context.store) throw util::MissingCollaborator("content store");
  return *context.store;
}

crypto::Signer& RequireSigner(const SdkContext& context) {
  if (!context.signer) throw util::MissingCollaborator("signer");
  return *context.signer;
}

const crypto::PermissionResolver& RequirePermissions(const SdkContext& context) {
  if (!context.permissions) throw util::MissingCollaborator("permission resolver");
  return *context.permissions;
}

const std::string& RequireFromId(const SdkContext& context) {
  if (context.from_id.empty()) throw util::MissingCollaborator("from id");
  return context.from_id;
}

void SetDefaultContext(SdkContext context) {
  auto next = std::make_shared<const SdkContext>(std::move(context));
  std::lock_guard lock(default_mutex);
  default_context = std::move(next);
}

std::shared_ptr<const SdkContext> DefaultContext() {
  std::lock_guard lock(default_mutex);
  return default_context;
}

batch::BatchArtifact CreateBatch(const std::string& key, batch::AnnouncementSource& source, const SdkContext& context) {
  return batch::CreateBatch(key, source, RequireStore(context), context.batch_options);
}

batch::BatchArtifact CreateBatch(const std::string& key, batch::AnnouncementSource& source) {
  return CreateBatch(key, source, *DefaultContext());
}

} // namespace dsnp
