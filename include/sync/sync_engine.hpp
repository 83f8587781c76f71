#ifndef S3SYNC_SYNC_ENGINE_HPP
#define S3SYNC_SYNC_ENGINE_HPP

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "config/sync_config.hpp"
#include "store/object_store.hpp"
#include "sync/batch_result.hpp"
#include "sync/object_lister.hpp"

namespace s3sync {
namespace sync {

// Checksum-driven transfers between local files and one bucket. Pairs of a
// batch are processed one at a time; a failing pair never aborts the batch.
class SyncEngine {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SyncEngine(store::ObjectStore& store, const config::SyncConfig& config,
             std::ostream& out = std::cout);


  // ---- LISTING ----
  ChecksumListing list_checksums(const std::string& prefix = "", const std::string& filter = "");


  // ---- BULK OPERATIONS ----
  // All pair operations throw ContractViolation before any work when the
  // source and destination lists differ in length.

  // Uploads each local file unless the key already holds identical content
  BatchResult upload_files(const std::vector<std::string>& local_paths,
                           const std::vector<std::string>& remote_keys,
                           bool make_public = false, bool encrypt = false);

  // Downloads each key unless the local copy already matches. Existing
  // directories at a destination are never written to.
  BatchResult download_files(const std::vector<std::string>& remote_keys,
                             const std::vector<std::string>& local_paths);

  // Copy then delete. An existing destination is never overwritten.
  BatchResult rename_keys(const std::vector<std::string>& src_keys,
                          const std::vector<std::string>& dst_keys,
                          bool keep_original = false, bool make_public = false);

  BatchResult delete_keys(const std::vector<std::string>& keys);


  // ---- CANCELLATION ----
  // Stops the running batch at the next remote call; every remaining pair is
  // reported as failed. Stays in effect until reset_cancellation().
  void cancel();
  void reset_cancellation();
  bool cancelled() const;

private:
  // ---- PARAMETERS ----
  store::ObjectStore& store_;
  const config::SyncConfig config_;
  std::ostream& out_;
  std::shared_ptr<store::CancellationToken> token_;


  // ---- BATCH DRIVER ----
  template <typename ItemFn>
  BatchResult run_batch(const std::string& operation,
                        const std::vector<std::string>& sources,
                        const std::vector<std::string>* destinations,
                        ItemFn process_item);
  void check_lengths(const std::string& operation, std::size_t sources, std::size_t destinations) const;
  // A fresh deadline for each remote call
  store::CallContext make_context() const;


  // ---- PER-ITEM OPERATIONS ----
  void upload_one(ItemResult& item, const store::TransferOptions& options);
  void download_one(ItemResult& item);
  void rename_one(ItemResult& item, bool keep_original, const store::TransferOptions& options);
  void delete_one(ItemResult& item);

  void skip(ItemResult& item, const std::string& reason);
};

} // namespace sync
} // namespace s3sync

#endif // S3SYNC_SYNC_ENGINE_HPP
