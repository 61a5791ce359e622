#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/announcement/announcement.hpp"
#include "internal/batch/batch_reader.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/content/content.hpp"
#include "internal/crypto/content_hasher.hpp"
#include "internal/factory.hpp"

namespace {

/*
  Stand-in signer for the walkthrough. Real applications plug in a wallet
  or key service here.
*/
class DemoSigner final : public dsnp::crypto::Signer {
 public:
  std::string Sign(std::string_view message) override {
    return SignatureFor(message);
  }

  std::string RecoverSigner(std::string_view message, std::string_view signature) const override {
    return signature == SignatureFor(message) ? "demo" : "";
  }

 private:
  static std::string SignatureFor(std::string_view message) {
    const auto digest = dsnp::crypto::HexDigest(message, "SHA256");
    return "0x" + digest + digest + "1c";
  }
};

} // namespace

int main(int argc, char** argv) {
  // Optional YAML config; defaults to an in-memory store.
  const std::string config_path = argc > 1 ? argv[1] : "";

  try {
    const auto config = config_path.empty() ? dsnp::config::ConfigLoader::LoadFromYamlString("identity:\n  from_id: \"42\"\n")
                                            : dsnp::config::ConfigLoader::LoadFromYaml(config_path);

    auto context   = dsnp::factory::BuildContext(config);
    context.signer = std::make_shared<DemoSigner>();
    if (!dsnp::crypto::ContentHasher::IsSupported(context.batch_options.content_digest)) {
      std::cerr << context.batch_options.content_digest << " unavailable in this OpenSSL build, using SHA3-256\n";
      context.batch_options.content_digest = "SHA3-256";
    }

    std::vector<dsnp::announcement::SignedAnnouncement> announcements;
    for (int i = 0; i < 3; ++i) {
      const auto note = R"({"type":"Note","content":"post )" + std::to_string(i) + R"("})";
      announcements.push_back(dsnp::content::PublishBroadcast(note, context));
    }

    dsnp::batch::VectorSource source(announcements);
    const auto                artifact = dsnp::CreateBatch("batches/broadcasts.parquet", source, context);
    std::cout << "batch " << artifact.uri << " rows=" << artifact.row_count << " hash=" << artifact.content_hash << '\n';

    auto reader = dsnp::batch::BatchReader::OpenStored(*context.store, "batches/broadcasts.parquet");
    std::cout << "fromId 42 present: " << std::boolalpha << reader->Probe("fromId", std::string("42")) << '\n';

    reader->ForEachRow([](const dsnp::announcement::SignedAnnouncement& row) {
      const auto& broadcast = std::get<dsnp::announcement::Broadcast>(row.announcement);
      std::cout << "  " << broadcast.url << " " << broadcast.content_hash << '\n';
    });
  } catch (const std::exception& e) {
    std::cerr << "batch round trip failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
