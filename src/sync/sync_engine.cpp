#include "sync/sync_engine.hpp"
#include "sync/fingerprint.hpp"
#include "sync/progress_tracker.hpp"
#include "utils/s3_path.hpp"
#include <filesystem>
#include <iomanip>
#include <system_error>
#include <boost/io/ios_state.hpp>
#include <boost/log/trivial.hpp>

namespace s3sync {
namespace sync {

namespace fs = std::filesystem;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SyncEngine::SyncEngine(store::ObjectStore& store, const config::SyncConfig& config, std::ostream& out)
  : store_(store)
  , config_(config)
  , out_(out)
  , token_(std::make_shared<store::CancellationToken>()) {
  BOOST_LOG_TRIVIAL(info) << "Sync engine: Initialized for bucket " << store_.bucket();
}


//==============================================
// LISTING
//==============================================

ChecksumListing SyncEngine::list_checksums(const std::string& prefix, const std::string& filter) {
  return sync::list_checksums(store_, utils::strip_bucket_prefix(prefix), filter, out_, make_context());
}


//==============================================
// BULK OPERATIONS
//==============================================

BatchResult SyncEngine::upload_files(const std::vector<std::string>& local_paths,
                                     const std::vector<std::string>& remote_keys,
                                     bool make_public, bool encrypt) {
  check_lengths("upload", local_paths.size(), remote_keys.size());

  store::TransferOptions options;
  if (make_public) {
    options.acl = store::PUBLIC_READ_ACL;
  }
  if (encrypt) {
    options.server_side_encryption = store::AES256_ENCRYPTION;
  }

  return run_batch("upload", local_paths, &remote_keys,
                   [this, &options](ItemResult& item) { upload_one(item, options); });
}

BatchResult SyncEngine::download_files(const std::vector<std::string>& remote_keys,
                                       const std::vector<std::string>& local_paths) {
  check_lengths("download", remote_keys.size(), local_paths.size());
  return run_batch("download", remote_keys, &local_paths,
                   [this](ItemResult& item) { download_one(item); });
}

BatchResult SyncEngine::rename_keys(const std::vector<std::string>& src_keys,
                                    const std::vector<std::string>& dst_keys,
                                    bool keep_original, bool make_public) {
  check_lengths("rename", src_keys.size(), dst_keys.size());

  store::TransferOptions options;
  if (make_public) {
    options.acl = store::PUBLIC_READ_ACL;
  }

  return run_batch("rename", src_keys, &dst_keys,
                   [this, keep_original, &options](ItemResult& item) {
                     rename_one(item, keep_original, options);
                   });
}

BatchResult SyncEngine::delete_keys(const std::vector<std::string>& keys) {
  return run_batch("delete", keys, nullptr,
                   [this](ItemResult& item) { delete_one(item); });
}


//==============================================
// CANCELLATION
//==============================================

void SyncEngine::cancel() {
  BOOST_LOG_TRIVIAL(warning) << "Sync engine: Cancellation requested";
  token_->cancel();
}

void SyncEngine::reset_cancellation() {
  token_ = std::make_shared<store::CancellationToken>();
}

bool SyncEngine::cancelled() const {
  return token_->cancelled();
}


//==============================================
// BATCH DRIVER
//==============================================

template <typename ItemFn>
BatchResult SyncEngine::run_batch(const std::string& operation,
                                  const std::vector<std::string>& sources,
                                  const std::vector<std::string>* destinations,
                                  ItemFn process_item) {
  const std::size_t total = sources.size();
  BOOST_LOG_TRIVIAL(info) << "Sync engine: Starting " << operation << " of " << total << " items";

  BatchResult result;
  for (std::size_t index = 0; index < total; ++index) {
    ItemResult item;
    item.index = index;
    item.source = sources[index];
    if (destinations) {
      item.destination = (*destinations)[index];
    }

    if (token_->cancelled()) {
      item.outcome = Outcome::Failed;
      item.reason = "cancelled";
    } else {
      try {
        process_item(item);
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Sync engine: " << operation << " of " << item.source
                                 << " failed: " << e.what();
        out_ << "Could not " << operation << ' ' << item.source << " because of: " << e.what()
             << ", skipping.." << '\n';
        item.outcome = Outcome::Failed;
        item.reason = e.what();
      }
    }

    BOOST_LOG_TRIVIAL(debug) << "Sync engine: Item " << index + 1 << "/" << total << " "
                             << outcome_to_string(item.outcome)
                             << (item.reason.empty() ? "" : ": " + item.reason);
    result.add(std::move(item));

    double percent = 100.0 * static_cast<double>(index + 1) / static_cast<double>(total);
    boost::io::ios_all_saver saver(out_);
    out_ << "finished " << operation << ' ' << index + 1 << '/' << total << '\n'
         << std::fixed << std::setprecision(2) << percent << "% complete" << std::endl;
  }

  BOOST_LOG_TRIVIAL(info) << "Sync engine: Finished " << operation << ": " << result.summary();
  return result;
}

void SyncEngine::check_lengths(const std::string& operation, std::size_t sources,
                               std::size_t destinations) const {
  if (sources != destinations) {
    BOOST_LOG_TRIVIAL(error) << "Sync engine: " << operation << " called with " << sources
                             << " sources and " << destinations << " destinations";
    throw ContractViolation(operation + ": source and destination lists must be the same length ("
                            + std::to_string(sources) + " vs " + std::to_string(destinations) + ")");
  }
}

store::CallContext SyncEngine::make_context() const {
  return store::CallContext(config_.call_timeout, token_);
}


//==============================================
// PER-ITEM OPERATIONS
//==============================================

void SyncEngine::upload_one(ItemResult& item, const store::TransferOptions& options) {
  // The bucket is fixed by the engine, any bucket named in a location is dropped
  item.source = utils::strip_bucket_prefix(item.source);
  item.destination = utils::strip_bucket_prefix(item.destination);
  const fs::path local_path(item.source);
  const std::string& key = item.destination;

  out_ << "Uploading " << item.source << " to bucket " << store_.bucket() << " as " << key << '\n';

  std::error_code ec;
  fs::file_status status = fs::status(local_path, ec);
  if (fs::is_directory(status)) {
    skip(item, "source is a directory");
    return;
  }
  if (!fs::is_regular_file(status)) {
    BOOST_LOG_TRIVIAL(error) << "Sync engine: Upload source missing: " << item.source;
    item.outcome = Outcome::Failed;
    item.reason = "source file does not exist: " + item.source;
    return;
  }

  std::optional<store::ObjectInfo> remote;
  try {
    remote = store_.head(key, make_context());
  } catch (const store::CallCancelled&) {
    throw;
  } catch (const store::StoreError& e) {
    if (!config_.treat_lookup_error_as_absent) {
      BOOST_LOG_TRIVIAL(error) << "Sync engine: Lookup of " << key << " failed: " << e.what();
      item.outcome = Outcome::Failed;
      item.reason = std::string("destination lookup failed: ") + e.what();
      return;
    }
    BOOST_LOG_TRIVIAL(warning) << "Sync engine: Lookup of " << key << " failed, uploading as new: " << e.what();
  }

  if (remote) {
    if (checksums_match(local_checksum(local_path), remote_checksum(*remote))) {
      skip(item, "unchanged");
      return;
    }
    BOOST_LOG_TRIVIAL(info) << "Sync engine: Checksum mismatch for " << key << ", re-uploading";
  }

  ProgressTracker tracker(LocalFileSize{local_path}, out_);
  store_.upload(local_path, key, options,
                [&tracker](std::uintmax_t bytes) { tracker.advance(bytes); },
                make_context());
  out_ << '\n';

  item.outcome = Outcome::Succeeded;
}

void SyncEngine::download_one(ItemResult& item) {
  item.source = utils::strip_bucket_prefix(item.source);
  const std::string& key = item.source;
  const fs::path local_path(item.destination);

  auto remote = store_.head(key, make_context());
  if (!remote) {
    out_ << key << " does not exist in bucket " << store_.bucket() << ", Skipping ..." << '\n';
    BOOST_LOG_TRIVIAL(warning) << "Sync engine: Download source missing: " << key;
    skip(item, "source does not exist");
    return;
  }

  if (local_path.has_parent_path() && !fs::exists(local_path.parent_path())) {
    BOOST_LOG_TRIVIAL(debug) << "Sync engine: Creating " << local_path.parent_path().string();
    fs::create_directories(local_path.parent_path());
  }

  std::error_code ec;
  fs::file_status status = fs::status(local_path, ec);
  if (fs::is_directory(status)) {
    skip(item, "destination is a directory");
    return;
  }

  if (fs::exists(status)) {
    if (checksums_match(local_checksum(local_path), remote_checksum(*remote))) {
      out_ << "Skipping " << key << ", already downloaded..." << '\n';
      skip(item, "already downloaded");
      return;
    }
    out_ << "Overwriting " << local_path.string() << " ..." << '\n';
  } else {
    out_ << "Downloading " << key << " to " << local_path.string() << '\n';
  }

  ProgressTracker tracker(RemoteObjectSize{*remote}, out_);
  store_.download(key, local_path,
                  [&tracker](std::uintmax_t bytes) { tracker.advance(bytes); },
                  make_context());
  out_ << '\n';

  item.outcome = Outcome::Succeeded;
}

void SyncEngine::rename_one(ItemResult& item, bool keep_original, const store::TransferOptions& options) {
  item.source = utils::strip_bucket_prefix(item.source);
  item.destination = utils::strip_bucket_prefix(item.destination);
  const std::string& src_key = item.source;
  const std::string& dst_key = item.destination;

  if (!store_.head(src_key, make_context())) {
    out_ << "source file " << src_key << " does not exist, skipping... " << '\n';
    BOOST_LOG_TRIVIAL(warning) << "Sync engine: Rename source missing: " << src_key;
    skip(item, "source does not exist");
    return;
  }

  // First existing destination wins
  if (store_.head(dst_key, make_context())) {
    out_ << "Destination key " << dst_key << " exists, skipping ..." << '\n';
    skip(item, "destination exists");
    return;
  }

  out_ << "copying source: " << src_key << " to destination " << dst_key << '\n';
  if (!options.acl.empty()) {
    out_ << "making public..." << '\n';
  }
  store_.copy(src_key, dst_key, options, make_context());

  if (!keep_original) {
    // Both keys remain when this fails; a re-run skips the pair because the
    // destination now exists
    try {
      store_.remove(src_key, make_context());
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Sync engine: Copied " << src_key << " to " << dst_key
                               << " but failed to delete the source: " << e.what();
      item.outcome = Outcome::Failed;
      item.reason = std::string("copied, source delete failed: ") + e.what();
      return;
    }
  }

  item.outcome = Outcome::Succeeded;
}

void SyncEngine::delete_one(ItemResult& item) {
  item.source = utils::strip_bucket_prefix(item.source);
  out_ << "attempting to delete " << item.source << " from " << store_.bucket() << "..." << '\n';
  store_.remove(item.source, make_context());
  item.outcome = Outcome::Succeeded;
}

void SyncEngine::skip(ItemResult& item, const std::string& reason) {
  BOOST_LOG_TRIVIAL(info) << "Sync engine: Skipping " << item.source << ": " << reason;
  item.outcome = Outcome::Skipped;
  item.reason = reason;
}

} // namespace sync
} // namespace s3sync
